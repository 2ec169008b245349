/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for store access and unit-of-work failures
 *
 * Two branches hang off DatabaseException:
 * - Store errors raised by Connection, Statement and Transaction
 *   (ConnectionException, QueryException, ConstraintException,
 *   TransactionException). These carry the SQLite result code.
 * - ORM errors raised by the unit of work and its collaborators
 *   (UnmappedTypeException, InvalidAggregateLinkException, CommitException).
 *
 * Catch DatabaseException to handle everything, or a leaf type to handle
 * one failure mode. A failed commit always surfaces as CommitException, with
 * the exception that caused it kept as cause().
 */

#pragma once

#include <exception>
#include <string>
#include <sqlite3.h>

namespace sqliteorm {

/**
 * @brief Base exception for all library errors
 */
class DatabaseException : public std::exception {
public:
    explicit DatabaseException(std::string message, int errorCode = 0)
        : message_(std::move(message))
        , errorCode_(errorCode)
    {
        if (errorCode_ != 0) {
            fullMessage_ = message_ + " (SQLite error code: " + std::to_string(errorCode_) + ")";
        } else {
            fullMessage_ = message_;
        }
    }

    const char* what() const noexcept override {
        return fullMessage_.c_str();
    }

    int errorCode() const noexcept {
        return errorCode_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

protected:
    std::string message_;
    std::string fullMessage_;
    int errorCode_;
};

/**
 * @brief Thrown when opening a database fails
 */
class ConnectionException : public DatabaseException {
public:
    explicit ConnectionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Connection error: " + message, errorCode) {}
};

/**
 * @brief Thrown when a statement fails to prepare or execute
 */
class QueryException : public DatabaseException {
public:
    QueryException(const std::string& message, const std::string& sql, int errorCode = 0)
        : DatabaseException("Query error: " + message, errorCode)
        , sql_(sql)
    {
        if (!sql_.empty()) {
            fullMessage_ += "\nSQL: " + sql_;
        }
    }

    const std::string& sql() const noexcept {
        return sql_;
    }

private:
    std::string sql_;
};

/**
 * @brief Thrown on unique, foreign key, check or not-null violations
 */
class ConstraintException : public DatabaseException {
public:
    explicit ConstraintException(const std::string& message, int errorCode = 0)
        : DatabaseException("Constraint violation: " + message, errorCode) {}
};

/**
 * @brief Thrown when BEGIN, COMMIT or ROLLBACK fails
 */
class TransactionException : public DatabaseException {
public:
    explicit TransactionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Transaction error: " + message, errorCode) {}
};

// ========== ORM errors ==========

/**
 * @brief Base for errors raised by the unit of work and its collaborators
 */
class OrmException : public DatabaseException {
public:
    explicit OrmException(const std::string& message, int errorCode = 0)
        : DatabaseException("ORM error: " + message, errorCode) {}
};

/**
 * @brief No data mapper is registered for an entity type
 */
class UnmappedTypeException : public OrmException {
public:
    explicit UnmappedTypeException(const std::string& typeName)
        : OrmException("No data mapper for " + typeName)
        , typeName_(typeName) {}

    const std::string& typeName() const noexcept {
        return typeName_;
    }

private:
    std::string typeName_;
};

/**
 * @brief An aggregate-root link was rejected at registration
 */
class InvalidAggregateLinkException : public OrmException {
public:
    explicit InvalidAggregateLinkException(const std::string& message)
        : OrmException("Invalid aggregate root link: " + message) {}
};

/**
 * @brief A commit failed and was rolled back
 *
 * Wraps whatever was thrown by a data mapper or the connection while the
 * transaction was open. The original exception is kept and can be
 * inspected with rethrowCause():
 *
 *   try {
 *       unitOfWork.commit();
 *   } catch (const CommitException& e) {
 *       try {
 *           e.rethrowCause();
 *       } catch (const ConstraintException& c) {
 *           // duplicate key, bad foreign key...
 *       }
 *   }
 */
class CommitException : public OrmException {
public:
    CommitException(const std::string& message, std::exception_ptr cause, int errorCode = 0)
        : OrmException("Commit failed: " + message, errorCode)
        , cause_(std::move(cause)) {}

    std::exception_ptr cause() const noexcept {
        return cause_;
    }

    /**
     * @brief Rethrow the exception that caused the commit to fail
     *
     * Does nothing if no cause was recorded.
     */
    void rethrowCause() const {
        if (cause_) {
            std::rethrow_exception(cause_);
        }
    }

private:
    std::exception_ptr cause_;
};

} // namespace sqliteorm
