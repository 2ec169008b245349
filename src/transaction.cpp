/**
 * @file transaction.cpp
 * @brief Implementation of Transaction
 */

#include "sqliteorm/transaction.hpp"
#include "sqliteorm/connection.hpp"
#include "sqliteorm/log.hpp"

namespace sqliteorm {

const char* toString(TransactionType type) {
    switch (type) {
        case TransactionType::Deferred:  return "DEFERRED";
        case TransactionType::Immediate: return "IMMEDIATE";
        case TransactionType::Exclusive: return "EXCLUSIVE";
    }
    return "DEFERRED";
}

Transaction::Transaction(Connection& conn, TransactionType type)
    : conn_(&conn)
{
    try {
        conn_->execute(std::string("BEGIN ") + toString(type) + " TRANSACTION");
    } catch (const DatabaseException& e) {
        active_ = false;
        throw TransactionException("Failed to begin transaction: " + e.message(), e.errorCode());
    }
}

Transaction::~Transaction() {
    if (active_ && conn_) {
        rollbackQuietly();
    }
}

Transaction::Transaction(Transaction&& other) noexcept
    : conn_(other.conn_)
    , active_(other.active_)
{
    other.conn_ = nullptr;
    other.active_ = false;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (active_ && conn_) {
            rollbackQuietly();
        }
        conn_ = other.conn_;
        active_ = other.active_;
        other.conn_ = nullptr;
        other.active_ = false;
    }
    return *this;
}

void Transaction::rollbackQuietly() noexcept {
    active_ = false;
    try {
        conn_->execute("ROLLBACK");
    } catch (const DatabaseException& e) {
        SQLITEORM_LOG_ERROR << "Rollback of abandoned transaction failed: " << e.what();
    }
}

void Transaction::commit() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }

    try {
        conn_->execute("COMMIT");
        active_ = false;
    } catch (const ConstraintException&) {
        throw;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to commit: " + e.message(), e.errorCode());
    }
}

void Transaction::rollback() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }

    try {
        conn_->execute("ROLLBACK");
        active_ = false;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to rollback: " + e.message(), e.errorCode());
    }
}

} // namespace sqliteorm
