/**
 * @file aggregate_roots.cpp
 * @brief Implementation of DependencyResolver
 */

#include "sqliteorm/aggregate_roots.hpp"

namespace sqliteorm {

size_t DependencyResolver::registerLink(EntityPtr parent, EntityPtr child,
                                        PropagateFunction propagate) {
    if (!parent) {
        throw InvalidAggregateLinkException("aggregate root is null");
    }
    if (!child) {
        throw InvalidAggregateLinkException("child is null");
    }
    if (parent == child) {
        throw InvalidAggregateLinkException("an entity cannot be its own aggregate root");
    }
    if (!propagate) {
        throw InvalidAggregateLinkException("propagate function is empty");
    }

    const size_t index = nextIndex_++;
    byChild_[child->token()].push_back(index);
    links_.emplace(index, AggregateLink{std::move(parent), std::move(child), std::move(propagate)});
    return index;
}

size_t DependencyResolver::propagateTo(const Entity& child) const {
    auto it = byChild_.find(child.token());
    if (it == byChild_.end()) {
        return 0;
    }

    size_t applied = 0;
    for (size_t index : it->second) {
        links_.at(index).apply();
        ++applied;
    }
    return applied;
}

void DependencyResolver::removeLinksFor(const Entity& child) {
    auto it = byChild_.find(child.token());
    if (it == byChild_.end()) {
        return;
    }
    for (size_t index : it->second) {
        links_.erase(index);
    }
    byChild_.erase(it);
}

bool DependencyResolver::hasLinks(const Entity& child) const {
    return byChild_.count(child.token()) > 0;
}

const AggregateLink* DependencyResolver::link(size_t index) const {
    auto it = links_.find(index);
    return it != links_.end() ? &it->second : nullptr;
}

void DependencyResolver::clear() {
    links_.clear();
    byChild_.clear();
}

} // namespace sqliteorm
