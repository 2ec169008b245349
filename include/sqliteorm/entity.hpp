/**
 * @file entity.hpp
 * @brief Base class for objects tracked by a unit of work
 *
 * An entity must be able to:
 * - expose and accept its Id (getId/setId); the Id stays empty until the
 *   entity's data mapper generates one on insert
 * - report its persistent fields as a FieldMap, which is what change
 *   detection compares against the snapshot
 * - deep-copy itself, which is how the unit of work takes snapshots
 *
 * Most entities derive from EntityBase<T>, which supplies the Id storage
 * and clone():
 *
 *   struct User : EntityBase<User> {
 *       std::string name;
 *       int64_t age = 0;
 *
 *       FieldMap snapshotFields() const override {
 *           return {{"id", getId()}, {"name", name}, {"age", age}};
 *       }
 *   };
 *
 * Every entity object also carries an EntityToken, a process-unique number
 * assigned at construction. The unit of work identifies objects by token,
 * so a copy of an entity is always a different object to it.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include "statement.hpp"

namespace sqliteorm {

using EntityToken = uint64_t;

/**
 * @brief Field name to value, as compared by change detection
 */
using FieldMap = std::map<std::string, Value>;

/**
 * @brief Where an entity stands relative to a unit of work
 *
 * Unmanaged -> Managed | Added -> Deleted; Detached can be reached from
 * Managed or Added. Deleted and Detached are terminal.
 */
enum class EntityState {
    Unmanaged,  // Not tracked
    Managed,    // Tracked and in sync with the store
    Added,      // Scheduled for insertion, not yet committed
    Deleted,    // Removed from the store
    Detached    // Explicitly dropped from tracking
};

const char* toString(EntityState state);

class Entity {
public:
    Entity();

    // Copies are distinct objects and get their own token
    Entity(const Entity& other);
    Entity& operator=(const Entity& other);

    virtual ~Entity() = default;

    EntityToken token() const noexcept { return token_; }

    virtual Value getId() const = 0;
    virtual void setId(const Value& id) = 0;

    virtual FieldMap snapshotFields() const = 0;

    /**
     * @brief Deep copy, used for snapshots
     */
    virtual std::unique_ptr<Entity> clone() const = 0;

private:
    EntityToken token_;
};

using EntityPtr = std::shared_ptr<Entity>;

/**
 * @brief Runtime type key used by the registry and the identity map
 */
using EntityType = std::type_index;

inline EntityType entityTypeOf(const Entity& entity) {
    return EntityType(typeid(entity));
}

template<typename T>
EntityType entityTypeOf() {
    return EntityType(typeid(T));
}

/**
 * @brief Entity with a Value Id and a copy-constructing clone()
 *
 * Derived must be copy constructible.
 */
template<typename Derived>
class EntityBase : public Entity {
public:
    Value getId() const override { return id_; }
    void setId(const Value& id) override { id_ = id; }

    std::unique_ptr<Entity> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

    /**
     * @brief Integer view of the Id; 0 while unset or not an INTEGER
     */
    int64_t id() const {
        if (const auto* v = std::get_if<int64_t>(&id_)) {
            return *v;
        }
        return 0;
    }

protected:
    Value id_;
};

} // namespace sqliteorm
