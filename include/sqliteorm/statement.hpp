/**
 * @file statement.hpp
 * @brief Prepared statements and the Value type shared with entities
 *
 * Value is the library's single scalar type. It is what a Statement binds
 * and reads, what an entity's Id holds, and what snapshotFields() reports
 * for change detection. Keeping one type for all three lets a data mapper
 * move a column straight into an Id or a field map without conversions.
 *
 * Statements are always parameterized:
 *   auto stmt = conn.prepare("UPDATE users SET name = ? WHERE id = ?");
 *   stmt.bind(1, user.name).bind(2, user.id).execute();
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace sqliteorm {

class Connection;

/**
 * @brief SQL NULL
 *
 * All NULLs compare equal so that Value can be ordered and used as a map
 * key (the identity map keys entities by Value).
 */
struct NullValue {};
static constexpr NullValue null{};

inline bool operator==(NullValue, NullValue) noexcept { return true; }
inline bool operator!=(NullValue, NullValue) noexcept { return false; }
inline bool operator<(NullValue, NullValue) noexcept { return false; }

/**
 * @brief One SQLite value: NULL, INTEGER, REAL, TEXT or BLOB
 *
 * Equality is strict: an INTEGER 1 and a REAL 1.0 are different values.
 */
using Value = std::variant<NullValue, int64_t, double, std::string, std::vector<uint8_t>>;

/**
 * @brief True if the value is SQL NULL
 */
inline bool isNull(const Value& value) noexcept {
    return std::holds_alternative<NullValue>(value);
}

/**
 * @brief Render a value for log and error messages
 */
std::string toString(const Value& value);

/**
 * @brief RAII wrapper for a prepared statement
 *
 * The statement is compiled in the constructor and finalized in the
 * destructor. The parent connection must outlive it.
 */
class Statement {
public:
    /**
     * @throws QueryException if the SQL does not compile
     */
    Statement(Connection& conn, const std::string& sql);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // ========== Parameter Binding (1-based) ==========

    Statement& bind(int index, int value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, const std::vector<uint8_t>& value);
    Statement& bind(int index, NullValue);
    Statement& bind(int index, const Value& value);

    /**
     * @brief Bind a named parameter (":name", "@name" or "$name")
     */
    template<typename T>
    Statement& bind(const std::string& name, const T& value) {
        int index = sqlite3_bind_parameter_index(stmt_, name.c_str());
        if (index == 0) {
            throw QueryException("Unknown parameter name: " + name, sql_);
        }
        return bind(index, value);
    }

    // ========== Execution ==========

    /**
     * @brief Run a statement that returns no rows, then reset it
     * @throws ConstraintException on constraint violations
     * @throws QueryException on any other failure
     */
    void execute();

    /**
     * @brief Advance to the next result row
     * @return false once the result set is exhausted
     */
    bool step();

    // ========== Column Access (0-based) ==========

    bool isNull(int index) const;
    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    std::string columnString(int index) const;
    std::vector<uint8_t> columnBlob(int index) const;

    /**
     * @brief Read a column as a Value, following its storage class
     */
    Value columnValue(int index) const;

    std::optional<std::string> columnOptionalString(int index) const;

    const std::string& sql() const { return sql_; }

private:
    void checkResult(int result, const std::string& operation);
    [[noreturn]] void throwStepError(int result);
    void finalize();

    sqlite3_stmt* stmt_ = nullptr;
    Connection* conn_;
    std::string sql_;
};

} // namespace sqliteorm
