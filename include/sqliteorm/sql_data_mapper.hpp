/**
 * @file sql_data_mapper.hpp
 * @brief Table-bound data mappers for SQLite
 *
 * SqlDataMapper<T> maps one entity type to one table whose primary key
 * column is "id". Derived classes write the SQL for their own columns;
 * nothing here generates it:
 *
 *   class UserMapper : public SqlDataMapper<User> {
 *   public:
 *       explicit UserMapper(Connection& conn) : SqlDataMapper(conn, "users") {}
 *
 *   protected:
 *       std::shared_ptr<User> fromRow(Statement& stmt) override {
 *           auto user = std::make_shared<User>();
 *           user->setId(stmt.columnInt64(0));
 *           user->name = stmt.columnString(1);
 *           return user;
 *       }
 *
 *       void insertRow(const User& user) override {
 *           conn_.prepare("INSERT INTO users (name) VALUES (?)")
 *               .bind(1, user.name).execute();
 *       }
 *
 *       void updateRow(const User& user) override {
 *           conn_.prepare("UPDATE users SET name = ? WHERE id = ?")
 *               .bind(1, user.name).bind(2, user.getId()).execute();
 *       }
 *   };
 *
 * Loading (findById, findAll) returns fresh, untracked objects. Pass them
 * through UnitOfWork::manage, or use a Repository, which does that for you.
 *
 * CachedSqlDataMapper<T> adds a read-through cache of committed rows. Its
 * writes are staged while the transaction is open and only reach the cache
 * when the unit of work calls commit() after the transaction commits.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include "connection.hpp"
#include "data_mapper.hpp"
#include "entity.hpp"
#include "statement.hpp"

namespace sqliteorm {

template<typename T, typename Base = DataMapper>
class SqlDataMapper : public Base {
    static_assert(std::is_base_of_v<Entity, T>, "T must derive from Entity");
    static_assert(std::is_base_of_v<DataMapper, Base>, "Base must derive from DataMapper");

public:
    SqlDataMapper(Connection& conn, const std::string& tableName,
                  std::unique_ptr<IdGenerator> idGenerator = std::make_unique<IntegerIdGenerator>())
        : conn_(conn)
        , tableName_(tableName)
        , idGenerator_(std::move(idGenerator))
    {}

    void add(Entity& entity) override {
        insertRow(cast(entity));
    }

    void update(Entity& entity) override {
        updateRow(cast(entity));
    }

    void remove(Entity& entity) override {
        deleteRow(cast(entity));
    }

    IdGenerator& getIdGenerator() override {
        return *idGenerator_;
    }

    /**
     * @return The row as a new object, or nullptr if there is none
     */
    virtual std::shared_ptr<T> findById(const Value& id) {
        auto stmt = conn_.prepare("SELECT * FROM " + tableName_ + " WHERE id = ?");
        stmt.bind(1, id);
        if (stmt.step()) {
            return fromRow(stmt);
        }
        return nullptr;
    }

    virtual std::vector<std::shared_ptr<T>> findAll() {
        auto stmt = conn_.prepare("SELECT * FROM " + tableName_ + " ORDER BY id");
        std::vector<std::shared_ptr<T>> results;
        while (stmt.step()) {
            results.push_back(fromRow(stmt));
        }
        return results;
    }

    int64_t count() {
        auto stmt = conn_.prepare("SELECT COUNT(*) FROM " + tableName_);
        stmt.step();
        return stmt.columnInt64(0);
    }

    bool exists(const Value& id) {
        auto stmt = conn_.prepare("SELECT 1 FROM " + tableName_ + " WHERE id = ? LIMIT 1");
        stmt.bind(1, id);
        return stmt.step();
    }

    const std::string& tableName() const { return tableName_; }

protected:
    /**
     * @brief Build an entity from the current row of a SELECT * statement
     */
    virtual std::shared_ptr<T> fromRow(Statement& stmt) = 0;

    virtual void insertRow(const T& entity) = 0;

    virtual void updateRow(const T& entity) = 0;

    virtual void deleteRow(const T& entity) {
        auto stmt = conn_.prepare("DELETE FROM " + tableName_ + " WHERE id = ?");
        stmt.bind(1, entity.getId());
        stmt.execute();
    }

    T& cast(Entity& entity) const {
        auto* typed = dynamic_cast<T*>(&entity);
        if (typed == nullptr) {
            throw OrmException("Data mapper for table " + tableName_ + " received an entity of type "
                               + entityTypeOf(entity).name());
        }
        return *typed;
    }

    Connection& conn_;
    std::string tableName_;
    std::unique_ptr<IdGenerator> idGenerator_;
};

template<typename T>
class CachedSqlDataMapper : public SqlDataMapper<T, CachedDataMapper> {
    using Base = SqlDataMapper<T, CachedDataMapper>;

public:
    using Base::Base;

    void add(Entity& entity) override {
        Base::add(entity);
        // The Id is only assigned after add(), so stage the object itself
        staged_.push_back(StagedWrite{&this->cast(entity), Value{}});
    }

    void update(Entity& entity) override {
        Base::update(entity);
        staged_.push_back(StagedWrite{&this->cast(entity), Value{}});
    }

    void remove(Entity& entity) override {
        Base::remove(entity);
        staged_.push_back(StagedWrite{nullptr, entity.getId()});
    }

    /**
     * @brief Copy staged writes into the cache
     *
     * Staged entities are still owned by the unit of work at this point.
     */
    void commit() override {
        for (const StagedWrite& write : staged_) {
            if (write.entity != nullptr) {
                cache_[write.entity->getId()] = std::make_shared<T>(*write.entity);
            } else {
                cache_.erase(write.erasedId);
            }
        }
        staged_.clear();
    }

    void discard() override {
        staged_.clear();
    }

    /**
     * @brief Served from the cache when present; misses read through to
     *        the table and are cached unless a transaction is open
     */
    std::shared_ptr<T> findById(const Value& id) override {
        auto it = cache_.find(id);
        if (it != cache_.end()) {
            return std::make_shared<T>(*it->second);
        }

        std::shared_ptr<T> loaded = Base::findById(id);
        if (loaded && !this->conn_.inTransaction()) {
            cache_[id] = std::make_shared<T>(*loaded);
        }
        return loaded;
    }

    bool isCached(const Value& id) const { return cache_.count(id) > 0; }

    size_t cacheSize() const { return cache_.size(); }

    size_t stagedCount() const { return staged_.size(); }

    void clearCache() { cache_.clear(); }

private:
    struct StagedWrite {
        const T* entity;  // Put this entity; nullptr means erase erasedId
        Value erasedId;
    };

    std::map<Value, std::shared_ptr<T>> cache_;
    std::vector<StagedWrite> staged_;
};

} // namespace sqliteorm
