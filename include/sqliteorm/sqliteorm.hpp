/**
 * @file sqliteorm.hpp
 * @brief Main include file for the sqliteorm library
 *
 * Include everything:
 *   #include <sqliteorm/sqliteorm.hpp>
 * or only what a translation unit needs:
 *   #include <sqliteorm/unit_of_work.hpp>
 *
 * ============================================================
 * SQLITEORM - Unit of Work over SQLite
 * ============================================================
 *
 * Store access
 *   Connection, Statement, Transaction: RAII wrappers over sqlite3
 *
 * Change tracking
 *   Entity          tokens, Ids and field maps
 *   IdentityMap     one instance per (type, Id)
 *   ChangeDetector  snapshot comparison, per-type comparison functions
 *
 * Persistence
 *   DataMapper, CachedDataMapper, DataMapperRegistry
 *   SqlDataMapper<T>, CachedSqlDataMapper<T>
 *   DependencyResolver  aggregate-root Id propagation
 *   UnitOfWork          atomic commit of inserts, updates and deletes
 *   Repository<T>       collection-style facade
 *
 * Support
 *   exceptions.hpp  DatabaseException hierarchy
 *   log.hpp         callback-routed logging
 *
 * ============================================================
 */

#pragma once

#include "exceptions.hpp"
#include "log.hpp"
#include "connection.hpp"
#include "statement.hpp"
#include "transaction.hpp"
#include "entity.hpp"
#include "identity_map.hpp"
#include "change_detector.hpp"
#include "aggregate_roots.hpp"
#include "data_mapper.hpp"
#include "sql_data_mapper.hpp"
#include "unit_of_work.hpp"
#include "repository.hpp"

namespace sqliteorm {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.1.0";

inline const char* sqliteVersion() {
    return sqlite3_libversion();
}

} // namespace sqliteorm
