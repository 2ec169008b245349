/**
 * @file fixtures.hpp
 * @brief Entities, mappers and schema shared by the tests
 *
 * Two kinds of mapper:
 * - UserMapper / PostMapper write real rows into an in-memory database
 * - ScriptedMapper writes nothing; it records calls into a journal and can
 *   be told to throw, which is how commit failures are provoked
 */

#pragma once

#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "sqliteorm/sqliteorm.hpp"

namespace sqliteorm {

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << toString(value);
}

inline std::ostream& operator<<(std::ostream& os, EntityState state) {
    return os << toString(state);
}

inline std::ostream& operator<<(std::ostream& os, CommitStage stage) {
    return os << toString(stage);
}

} // namespace sqliteorm

namespace fixtures {

using namespace sqliteorm;

// ========== Entities ==========

struct User : EntityBase<User> {
    std::string name;
    std::string email;
    int64_t age = 0;

    User() = default;
    explicit User(std::string n, std::string e = "", int64_t a = 0)
        : name(std::move(n)), email(std::move(e)), age(a) {}

    FieldMap snapshotFields() const override {
        return {{"id", getId()}, {"name", name}, {"email", email}, {"age", age}};
    }
};

struct Post : EntityBase<Post> {
    int64_t userId = 0;
    std::string title;

    Post() = default;
    explicit Post(std::string t) : title(std::move(t)) {}

    FieldMap snapshotFields() const override {
        return {{"id", getId()}, {"user_id", userId}, {"title", title}};
    }
};

// Has no data mapper anywhere in the tests
struct Tag : EntityBase<Tag> {
    std::string label;

    FieldMap snapshotFields() const override {
        return {{"id", getId()}, {"label", label}};
    }
};

// ========== Schema ==========

inline void createSchema(Connection& conn) {
    conn.execute(R"(
        CREATE TABLE users (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            email TEXT UNIQUE,
            age INTEGER NOT NULL DEFAULT 0
        );
        CREATE TABLE posts (
            id INTEGER PRIMARY KEY,
            user_id INTEGER NOT NULL
                REFERENCES users(id) DEFERRABLE INITIALLY DEFERRED,
            title TEXT NOT NULL
        );
    )");
}

inline int64_t countRows(Connection& conn, const std::string& table) {
    auto stmt = conn.prepare("SELECT COUNT(*) FROM " + table);
    stmt.step();
    return stmt.columnInt64(0);
}

// ========== SQL mappers ==========

class UserMapper : public SqlDataMapper<User> {
public:
    explicit UserMapper(Connection& conn) : SqlDataMapper(conn, "users") {}

protected:
    std::shared_ptr<User> fromRow(Statement& stmt) override {
        auto user = std::make_shared<User>(stmt.columnString(1), stmt.columnString(2),
                                           stmt.columnInt64(3));
        user->setId(stmt.columnInt64(0));
        return user;
    }

    void insertRow(const User& user) override {
        auto stmt = conn_.prepare("INSERT INTO users (name, email, age) VALUES (?, ?, ?)");
        stmt.bind(1, user.name).bind(2, user.email).bind(3, user.age).execute();
    }

    void updateRow(const User& user) override {
        auto stmt = conn_.prepare("UPDATE users SET name = ?, email = ?, age = ? WHERE id = ?");
        stmt.bind(1, user.name).bind(2, user.email).bind(3, user.age).bind(4, user.getId()).execute();
    }
};

class PostMapper : public SqlDataMapper<Post> {
public:
    explicit PostMapper(Connection& conn) : SqlDataMapper(conn, "posts") {}

protected:
    std::shared_ptr<Post> fromRow(Statement& stmt) override {
        auto post = std::make_shared<Post>(stmt.columnString(2));
        post->setId(stmt.columnInt64(0));
        post->userId = stmt.columnInt64(1);
        return post;
    }

    void insertRow(const Post& post) override {
        auto stmt = conn_.prepare("INSERT INTO posts (user_id, title) VALUES (?, ?)");
        stmt.bind(1, post.userId).bind(2, post.title).execute();
    }

    void updateRow(const Post& post) override {
        auto stmt = conn_.prepare("UPDATE posts SET user_id = ?, title = ? WHERE id = ?");
        stmt.bind(1, post.userId).bind(2, post.title).bind(3, post.getId()).execute();
    }
};

class CachedUserMapper : public CachedSqlDataMapper<User> {
public:
    explicit CachedUserMapper(Connection& conn) : CachedSqlDataMapper(conn, "users") {}

protected:
    std::shared_ptr<User> fromRow(Statement& stmt) override {
        ++rowsRead;
        auto user = std::make_shared<User>(stmt.columnString(1), stmt.columnString(2),
                                           stmt.columnInt64(3));
        user->setId(stmt.columnInt64(0));
        return user;
    }

    void insertRow(const User& user) override {
        auto stmt = conn_.prepare("INSERT INTO users (name, email, age) VALUES (?, ?, ?)");
        stmt.bind(1, user.name).bind(2, user.email).bind(3, user.age).execute();
    }

    void updateRow(const User& user) override {
        auto stmt = conn_.prepare("UPDATE users SET name = ?, email = ?, age = ? WHERE id = ?");
        stmt.bind(1, user.name).bind(2, user.email).bind(3, user.age).bind(4, user.getId()).execute();
    }

public:
    int rowsRead = 0;
};

// Publishing throws while failCommits is positive; the staged writes stay staged
class FlakyCachedUserMapper : public CachedUserMapper {
public:
    using CachedUserMapper::CachedUserMapper;

    void commit() override {
        if (failCommits > 0) {
            --failCommits;
            throw std::runtime_error("cache down");
        }
        CachedUserMapper::commit();
    }

    int failCommits = 0;
};

// ========== Scripted mappers ==========

/**
 * @brief Hands out consecutive integer Ids starting at first
 */
class SequenceIdGenerator : public IdGenerator {
public:
    explicit SequenceIdGenerator(int64_t first = 1) : next_(first) {}

    Value generate(const Entity&, Connection&) override { return next_++; }
    Value emptyValue() const override { return int64_t{0}; }

private:
    int64_t next_;
};

class ScriptedMapper : public DataMapper {
public:
    using Hook = std::function<void(Entity&)>;

    ScriptedMapper(std::vector<std::string>& journal, std::string name, int64_t firstId = 1)
        : journal_(journal), name_(std::move(name)), ids_(firstId) {}

    void add(Entity& entity) override {
        journal_.push_back("add " + name_);
        if (onAdd) onAdd(entity);
    }

    void update(Entity& entity) override {
        journal_.push_back("update " + name_ + " " + toString(entity.getId()));
        if (onUpdate) onUpdate(entity);
    }

    void remove(Entity& entity) override {
        journal_.push_back("remove " + name_ + " " + toString(entity.getId()));
        if (onRemove) onRemove(entity);
    }

    IdGenerator& getIdGenerator() override { return ids_; }

    Hook onAdd;
    Hook onUpdate;
    Hook onRemove;

private:
    std::vector<std::string>& journal_;
    std::string name_;
    SequenceIdGenerator ids_;
};

/**
 * @brief ScriptedMapper with the caching capability
 */
class ScriptedCachedMapper : public CachedDataMapper {
public:
    ScriptedCachedMapper(std::vector<std::string>& journal, std::string name)
        : inner_(journal, std::move(name)), journal_(journal) {}

    void add(Entity& entity) override { inner_.add(entity); }
    void update(Entity& entity) override { inner_.update(entity); }
    void remove(Entity& entity) override { inner_.remove(entity); }
    IdGenerator& getIdGenerator() override { return inner_.getIdGenerator(); }

    void commit() override { journal_.push_back("cache commit"); }
    void discard() override { journal_.push_back("cache discard"); }

    ScriptedMapper& inner() { return inner_; }

private:
    ScriptedMapper inner_;
    std::vector<std::string>& journal_;
};

/**
 * @brief Captures the schedules as they stand when preCommit() runs
 */
class ObservedUnitOfWork : public UnitOfWork {
public:
    using UnitOfWork::UnitOfWork;

    std::vector<EntityPtr> updatesAtPreCommit;
    int preCommitCalls = 0;
    int postRollbackCalls = 0;

protected:
    void preCommit() override {
        ++preCommitCalls;
        updatesAtPreCommit = getScheduledEntityUpdates();
    }

    void postRollback() override {
        ++postRollbackCalls;
        UnitOfWork::postRollback();
    }
};

inline bool contains(const std::vector<EntityPtr>& entities, const EntityPtr& entity) {
    for (const auto& e : entities) {
        if (e == entity) {
            return true;
        }
    }
    return false;
}

} // namespace fixtures
