/**
 * @file identity_map.hpp
 * @brief One canonical in-memory instance per (entity type, Id)
 *
 * Entities are tracked by token. Those with an assigned Id are also indexed
 * by (type, Id), and that index is what guarantees uniqueness: adding a
 * second object with the same type and Id yields the instance already
 * tracked. Entities whose Id is still empty are tracked by token only, so
 * two new entities never collapse into one.
 */

#pragma once

#include <map>
#include <optional>
#include <unordered_map>
#include <vector>
#include "entity.hpp"

namespace sqliteorm {

class IdentityMap {
public:
    /**
     * @brief Track an entity
     * @param identified Index the entity by its current Id; pass false while
     *        the Id is empty
     * @return The canonical instance: the entity already indexed under the
     *         same type and Id if there is one, otherwise entity itself
     */
    EntityPtr add(const EntityPtr& entity, bool identified);

    /**
     * @brief Stop tracking an entity and drop its Id index entry
     */
    void remove(const Entity& entity);

    /**
     * @return The tracked instance, or nullptr
     */
    EntityPtr find(const EntityType& type, const Value& id) const;

    bool contains(const Entity& entity) const;

    /**
     * @brief All tracked entities, oldest first
     */
    std::vector<EntityPtr> entities() const;

    size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

    void clear();

private:
    struct Entry {
        EntityPtr entity;
        std::optional<Value> indexedId;
    };

    void unindex(EntityToken token, Entry& entry);

    // Tokens grow monotonically, so this map iterates in creation order
    std::map<EntityToken, Entry> entries_;
    std::unordered_map<EntityType, std::map<Value, EntityToken>> index_;
};

} // namespace sqliteorm
