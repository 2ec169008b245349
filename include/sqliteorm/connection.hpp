/**
 * @file connection.hpp
 * @brief SQLite connection: the store a unit of work commits into
 *
 * A Connection owns one sqlite3 handle for its lifetime. It is the only
 * shared resource of a UnitOfWork: every data mapper writes through it and
 * the unit of work brackets those writes with beginTransaction() and the
 * returned Transaction guard.
 *
 * Connections are move-only. Copying would duplicate ownership of the
 * handle.
 */

#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <sqlite3.h>
#include "exceptions.hpp"
#include "transaction.hpp"

namespace sqliteorm {

/**
 * @brief Settings applied when a connection is opened
 *
 *   ConnectionOptions opts;
 *   opts.busyTimeoutMs = 1000;
 *   auto conn = Connection::open("app.db", opts);
 */
struct ConnectionOptions {
    // Write-ahead logging; readers do not block the committing writer
    bool enableWAL = true;

    // How long to wait on a lock held by another connection
    int busyTimeoutMs = 5000;

    // SQLite leaves foreign keys unenforced unless asked
    bool enableForeignKeys = true;

    bool readOnly = false;

    bool createIfNotExists = true;

    // Report extended result codes (e.g. SQLITE_CONSTRAINT_UNIQUE)
    bool extendedResultCodes = true;
};

class Statement;

/**
 * @brief RAII wrapper for a SQLite database connection
 */
class Connection {
public:
    /**
     * @param dbPath Database file, or ":memory:"
     * @throws ConnectionException if the database cannot be opened
     */
    explicit Connection(const std::string& dbPath,
                        const ConnectionOptions& options = ConnectionOptions{});

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    static std::unique_ptr<Connection> open(
        const std::string& dbPath,
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Open a private in-memory database
     *
     * Each call yields a fresh, empty database, which is what tests want.
     */
    static std::unique_ptr<Connection> inMemory(
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Run one or more SQL statements that return no rows
     * @throws ConstraintException on constraint violations
     * @throws QueryException on any other failure
     */
    void execute(const std::string& sql);

    Statement prepare(const std::string& sql);

    /**
     * @brief Begin a transaction
     * @return Guard that rolls back on destruction unless committed
     * @throws TransactionException if BEGIN fails
     */
    Transaction beginTransaction(TransactionType type = TransactionType::Deferred);

    /**
     * @brief Whether a transaction is open on this connection
     */
    bool inTransaction() const;

    int64_t lastInsertRowId() const;

    /**
     * @brief Rows changed by the most recent INSERT, UPDATE or DELETE
     */
    int changes() const;

    bool tableExists(const std::string& tableName);

    sqlite3* handle() const { return db_; }

    const std::string& path() const { return dbPath_; }

    bool isOpen() const { return db_ != nullptr; }

private:
    void applyOptions(const ConnectionOptions& options);
    void close();

    sqlite3* db_ = nullptr;
    std::string dbPath_;
};

} // namespace sqliteorm
