/**
 * @file transaction.hpp
 * @brief RAII transaction guard
 *
 * The unit of work writes every scheduled change inside one transaction:
 *
 *   Transaction txn = conn.beginTransaction();
 *   mapper.add(entity);       // may throw
 *   mapper.update(other);     // may throw
 *   txn.commit();
 *
 * A guard that is destroyed while still active rolls back, so an exception
 * thrown between BEGIN and COMMIT can never leave the connection inside an
 * open transaction.
 */

#pragma once

#include <string>
#include "exceptions.hpp"

namespace sqliteorm {

class Connection;

/**
 * @brief SQLite locking strategy for BEGIN
 */
enum class TransactionType {
    Deferred,   // Locks taken on first access
    Immediate,  // Write lock taken at BEGIN
    Exclusive   // No other connection may read or write
};

const char* toString(TransactionType type);

/**
 * @brief Guard for one BEGIN ... COMMIT/ROLLBACK bracket
 */
class Transaction {
public:
    /**
     * @throws TransactionException if BEGIN fails
     */
    explicit Transaction(Connection& conn,
                         TransactionType type = TransactionType::Deferred);

    /**
     * @brief Rolls back if still active; never throws
     */
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    /**
     * @throws ConstraintException if a deferred constraint fails at COMMIT
     *         (the transaction stays active and can be rolled back)
     * @throws TransactionException on any other failure
     */
    void commit();

    /**
     * @throws TransactionException if ROLLBACK fails
     */
    void rollback();

    bool isActive() const { return active_; }

private:
    void rollbackQuietly() noexcept;

    Connection* conn_;
    bool active_ = true;
};

} // namespace sqliteorm
