/**
 * @file identity_map.cpp
 * @brief Implementation of IdentityMap
 */

#include "sqliteorm/identity_map.hpp"

namespace sqliteorm {

EntityPtr IdentityMap::add(const EntityPtr& entity, bool identified) {
    const EntityType type = entityTypeOf(*entity);
    const Value id = entity->getId();

    if (identified) {
        if (EntityPtr existing = find(type, id)) {
            return existing;
        }
    }

    Entry& entry = entries_[entity->token()];
    entry.entity = entity;

    if (identified) {
        unindex(entity->token(), entry);
        index_[type][id] = entity->token();
        entry.indexedId = id;
    }

    return entity;
}

void IdentityMap::unindex(EntityToken token, Entry& entry) {
    if (!entry.indexedId) {
        return;
    }

    auto byType = index_.find(entityTypeOf(*entry.entity));
    if (byType != index_.end()) {
        auto it = byType->second.find(*entry.indexedId);
        if (it != byType->second.end() && it->second == token) {
            byType->second.erase(it);
        }
        if (byType->second.empty()) {
            index_.erase(byType);
        }
    }
    entry.indexedId.reset();
}

void IdentityMap::remove(const Entity& entity) {
    auto it = entries_.find(entity.token());
    if (it == entries_.end()) {
        return;
    }
    unindex(it->first, it->second);
    entries_.erase(it);
}

EntityPtr IdentityMap::find(const EntityType& type, const Value& id) const {
    auto byType = index_.find(type);
    if (byType == index_.end()) {
        return nullptr;
    }

    auto byId = byType->second.find(id);
    if (byId == byType->second.end()) {
        return nullptr;
    }

    auto entry = entries_.find(byId->second);
    return entry != entries_.end() ? entry->second.entity : nullptr;
}

bool IdentityMap::contains(const Entity& entity) const {
    return entries_.count(entity.token()) > 0;
}

std::vector<EntityPtr> IdentityMap::entities() const {
    std::vector<EntityPtr> result;
    result.reserve(entries_.size());
    for (const auto& item : entries_) {
        result.push_back(item.second.entity);
    }
    return result;
}

void IdentityMap::clear() {
    entries_.clear();
    index_.clear();
}

} // namespace sqliteorm
