/**
 * @file main.cpp
 * @brief Walkthrough of a unit of work over an in-memory database
 *
 * This example shows:
 * 1. Entities and hand-written data mappers
 * 2. Scheduling inserts and propagating a generated Id to child rows
 * 3. Change detection on managed entities
 * 4. Repositories and the identity map
 * 5. A failed commit, its rollback and a retry
 * 6. A read-through cache that only sees committed writes
 * 7. Routing library logs into the application
 */

#include <iostream>
#include "sqliteorm/sqliteorm.hpp"

using namespace sqliteorm;

// ========== Domain Model ==========

struct User : EntityBase<User> {
    std::string name;
    std::string email;
    int64_t age = 0;

    FieldMap snapshotFields() const override {
        return {{"id", getId()}, {"name", name}, {"email", email}, {"age", age}};
    }
};

struct Post : EntityBase<Post> {
    int64_t userId = 0;
    std::string title;

    FieldMap snapshotFields() const override {
        return {{"id", getId()}, {"user_id", userId}, {"title", title}};
    }
};

std::shared_ptr<User> makeUser(const std::string& name, const std::string& email, int64_t age) {
    auto user = std::make_shared<User>();
    user->name = name;
    user->email = email;
    user->age = age;
    return user;
}

// ========== Data Mappers ==========

class UserMapper : public CachedSqlDataMapper<User> {
public:
    explicit UserMapper(Connection& conn) : CachedSqlDataMapper(conn, "users") {}

    std::shared_ptr<User> findByEmail(const std::string& email) {
        auto stmt = conn_.prepare("SELECT * FROM users WHERE email = ?");
        stmt.bind(1, email);
        return stmt.step() ? fromRow(stmt) : nullptr;
    }

protected:
    std::shared_ptr<User> fromRow(Statement& stmt) override {
        auto user = makeUser(stmt.columnString(1), stmt.columnString(2), stmt.columnInt64(3));
        user->setId(stmt.columnInt64(0));
        return user;
    }

    void insertRow(const User& user) override {
        auto stmt = conn_.prepare("INSERT INTO users (name, email, age) VALUES (?, ?, ?)");
        stmt.bind(1, user.name).bind(2, user.email).bind(3, user.age).execute();
    }

    void updateRow(const User& user) override {
        auto stmt = conn_.prepare("UPDATE users SET name = ?, email = ?, age = ? WHERE id = ?");
        stmt.bind(1, user.name)
            .bind(2, user.email)
            .bind(3, user.age)
            .bind(4, user.getId())
            .execute();
    }
};

class PostMapper : public SqlDataMapper<Post> {
public:
    explicit PostMapper(Connection& conn) : SqlDataMapper(conn, "posts") {}

protected:
    std::shared_ptr<Post> fromRow(Statement& stmt) override {
        auto post = std::make_shared<Post>();
        post->setId(stmt.columnInt64(0));
        post->userId = stmt.columnInt64(1);
        post->title = stmt.columnString(2);
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

// ========== Demo Functions ==========

void printSection(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void createSchema(Connection& conn) {
    conn.execute(R"(
        CREATE TABLE users (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            email TEXT UNIQUE NOT NULL,
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

void demonstrateInsertWithChildren(UnitOfWork& uow, Connection& conn) {
    printSection("Inserting an Aggregate");

    auto alice = makeUser("Alice", "alice@example.com", 30);
    auto hello = std::make_shared<Post>();
    hello->title = "Hello";
    auto again = std::make_shared<Post>();
    again->title = "Hello again";

    uow.scheduleForInsertion(alice);
    uow.scheduleForInsertion(hello);
    uow.scheduleForInsertion(again);

    // alice has no Id yet; the posts receive it right before they are written
    auto ownedByAlice = [](const User& user, Post& post) { post.userId = user.id(); };
    uow.registerAggregateRootChild<User, Post>(alice, hello, ownedByAlice);
    uow.registerAggregateRootChild<User, Post>(alice, again, ownedByAlice);

    uow.commit();

    std::cout << "  Alice got ID " << alice->id() << "\n";

    auto stmt = conn.prepare("SELECT id, user_id, title FROM posts ORDER BY id");
    while (stmt.step()) {
        std::cout << "    Post " << stmt.columnInt64(0)
                  << " (user " << stmt.columnInt64(1) << "): "
                  << stmt.columnString(2) << "\n";
    }
}

void demonstrateChangeDetection(UnitOfWork& uow, Repository<User, UserMapper>& users) {
    printSection("Change Detection");

    auto alice = users.getById(int64_t{1});
    std::cout << "  Loaded " << alice->name << ", age " << alice->age << "\n";

    alice->age = 31;
    uow.commit();

    auto stored = users.getDataMapper().findByEmail("alice@example.com");
    std::cout << "  Age in the table after commit: " << stored->age << "\n";

    // Same row, same object
    std::cout << "  Identity map returns the same instance: "
              << (users.getById(int64_t{1}) == alice ? "yes" : "no") << "\n";
}

void demonstrateRollback(UnitOfWork& uow, Connection& conn) {
    printSection("Rollback and Retry");

    auto bob = makeUser("Bob", "bob@example.com", 25);
    auto orphan = std::make_shared<Post>();
    orphan->title = "Nobody wrote this";
    orphan->userId = 999;

    uow.scheduleForInsertion(bob);
    uow.scheduleForInsertion(orphan);

    try {
        uow.commit();
    } catch (const CommitException& e) {
        std::cout << "  Commit failed: " << e.what() << "\n";
        std::cout << "  Stage: " << toString(uow.stage()) << "\n";
        std::cout << "  Bob's ID after rollback: " << toString(bob->getId()) << "\n";
        std::cout << "  Still scheduled for insertion: "
                  << uow.getScheduledEntityInsertions().size() << "\n";
    }

    orphan->userId = 1;
    uow.commit();

    auto stmt = conn.prepare("SELECT COUNT(*) FROM users");
    stmt.step();
    std::cout << "  Retry committed; users in table: " << stmt.columnInt64(0) << "\n";
}

void demonstrateCache(UnitOfWork& uow, Repository<User, UserMapper>& users) {
    printSection("Read-Through Cache");

    UserMapper& mapper = users.getDataMapper();
    std::cout << "  Cached users: " << mapper.cacheSize() << "\n";

    auto carol = makeUser("Carol", "carol@example.com", 41);
    users.add(carol);
    uow.commit();

    std::cout << "  Carol cached after commit: "
              << (mapper.isCached(carol->getId()) ? "yes" : "no") << "\n";

    users.remove(carol);
    uow.commit();
    std::cout << "  Carol cached after delete: "
              << (mapper.isCached(carol->getId()) ? "yes" : "no") << "\n";
    std::cout << "  Carol's state: " << toString(uow.getEntityState(*carol)) << "\n";
}

// ========== Main ==========

int main() {
    std::cout << "sqliteorm - Unit of Work Demo\n";
    std::cout << "SQLite version: " << sqliteVersion() << "\n";
    std::cout << "Library version: " << VERSION_STRING << "\n";

    log::setCallback([](log::Level level, const char* msg, size_t len) {
        if (level >= log::Level::Warn) {
            std::cerr << "[" << log::levelName(level) << "] " << std::string(msg, len) << "\n";
        }
    });

    try {
        ConnectionOptions options;
        options.enableForeignKeys = true;

        auto conn = Connection::inMemory(options);
        createSchema(*conn);

        UnitOfWork uow(*conn);
        Repository<User, UserMapper> users(uow, std::make_shared<UserMapper>(*conn));
        uow.registerDataMapper<Post>(std::make_shared<PostMapper>(*conn));

        demonstrateInsertWithChildren(uow, *conn);
        demonstrateChangeDetection(uow, users);
        demonstrateRollback(uow, *conn);
        demonstrateCache(uow, users);

        std::cout << "\nDemo completed successfully!\n";

    } catch (const DatabaseException& e) {
        std::cerr << "Database error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
