/**
 * @file aggregate_roots.hpp
 * @brief Aggregate-root links: copy a parent's generated Id into a child
 *
 * A child row often needs its parent's Id (a foreign key), and that Id only
 * exists once the parent has been inserted. A link records the pair and a
 * propagate function; the unit of work applies every link for an entity
 * immediately before writing it:
 *
 *   uow.registerAggregateRootChild<User, Post>(user, post,
 *       [](const User& u, Post& p) { p.userId = u.id(); });
 *   uow.scheduleForInsertion(user);   // parents first
 *   uow.scheduleForInsertion(post);
 *   uow.commit();                     // post.userId set before its INSERT
 *
 * Links are applied in registration order and only work if parents are
 * written before their children; the resolver does not reorder writes.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <unordered_map>
#include <vector>
#include "entity.hpp"

namespace sqliteorm {

using PropagateFunction = std::function<void(const Entity& parent, Entity& child)>;

struct AggregateLink {
    EntityPtr parent;
    EntityPtr child;
    PropagateFunction propagate;

    void apply() const { propagate(*parent, *child); }
};

class DependencyResolver {
public:
    /**
     * @brief Record that child's persisted form depends on parent
     * @return Index of the stored link
     * @throws InvalidAggregateLinkException if either entity is null, they
     *         are the same object, or the function is empty
     */
    size_t registerLink(EntityPtr parent, EntityPtr child, PropagateFunction propagate);

    /**
     * @brief Apply every link registered for child, in registration order
     * @return Number of links applied
     */
    size_t propagateTo(const Entity& child) const;

    /**
     * @brief Drop the links in which entity is the child
     */
    void removeLinksFor(const Entity& child);

    bool hasLinks(const Entity& child) const;

    const AggregateLink* link(size_t index) const;

    size_t size() const { return links_.size(); }

    void clear();

private:
    std::map<size_t, AggregateLink> links_;
    std::unordered_map<EntityToken, std::vector<size_t>> byChild_;
    size_t nextIndex_ = 0;
};

} // namespace sqliteorm
