/**
 * @file schedule_set.hpp
 * @brief Insertion-ordered set of entities pending one kind of write
 */

#pragma once

#include <algorithm>
#include <unordered_set>
#include <vector>
#include "entity.hpp"

namespace sqliteorm {

/**
 * @brief Entities keyed by token, iterated in scheduling order
 *
 * Order matters: aggregate-root links rely on parents being scheduled
 * before their children.
 */
class ScheduleSet {
public:
    /**
     * @return false if the entity was already scheduled
     */
    bool add(const EntityPtr& entity) {
        if (!tokens_.insert(entity->token()).second) {
            return false;
        }
        order_.push_back(entity);
        return true;
    }

    bool erase(EntityToken token) {
        if (tokens_.erase(token) == 0) {
            return false;
        }
        order_.erase(std::remove_if(order_.begin(), order_.end(),
                                    [token](const EntityPtr& e) { return e->token() == token; }),
                     order_.end());
        return true;
    }

    bool contains(EntityToken token) const { return tokens_.count(token) > 0; }

    const std::vector<EntityPtr>& entities() const { return order_; }

    bool empty() const { return order_.empty(); }
    size_t size() const { return order_.size(); }

    void clear() {
        order_.clear();
        tokens_.clear();
    }

private:
    std::vector<EntityPtr> order_;
    std::unordered_set<EntityToken> tokens_;
};

} // namespace sqliteorm
