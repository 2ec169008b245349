/**
 * @file entity.cpp
 * @brief Entity token allocation
 */

#include "sqliteorm/entity.hpp"
#include <atomic>

namespace sqliteorm {

namespace {

EntityToken nextToken() {
    static std::atomic<EntityToken> counter{0};
    return ++counter;
}

} // namespace

const char* toString(EntityState state) {
    switch (state) {
        case EntityState::Unmanaged: return "UNMANAGED";
        case EntityState::Managed:   return "MANAGED";
        case EntityState::Added:     return "ADDED";
        case EntityState::Deleted:   return "DELETED";
        case EntityState::Detached:  return "DETACHED";
    }
    return "UNMANAGED";
}

Entity::Entity()
    : token_(nextToken())
{}

Entity::Entity(const Entity&)
    : token_(nextToken())
{}

Entity& Entity::operator=(const Entity&) {
    return *this;
}

} // namespace sqliteorm
