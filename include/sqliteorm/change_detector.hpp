/**
 * @file change_detector.hpp
 * @brief Dirty checking against snapshots
 *
 * Two strategies, chosen per entity type:
 * - A registered comparison function. It receives (snapshot, current) and
 *   returns true when they hold the same data. Registering one for a type
 *   turns the structural comparison off for every entity of that type.
 * - Structural comparison of snapshotFields(): changed if the field counts
 *   differ, or any snapshot field is missing from the current fields or
 *   holds a value that is not strictly equal.
 */

#pragma once

#include <functional>
#include <unordered_map>
#include "entity.hpp"

namespace sqliteorm {

/**
 * @brief Equality predicate: true if snapshot and current are identical
 */
using ComparisonFunction = std::function<bool(const Entity& snapshot, const Entity& current)>;

class ChangeDetector {
public:
    /**
     * @brief Set the comparison function for a type, replacing any previous one
     * @throws OrmException if the function is empty
     */
    void registerComparisonFunction(const EntityType& type, ComparisonFunction function);

    bool hasComparisonFunction(const EntityType& type) const;

    /**
     * @brief Whether current has diverged from snapshot
     */
    bool hasChanged(const Entity& snapshot, const Entity& current) const;

    static bool fieldsDiffer(const FieldMap& original, const FieldMap& current);

private:
    std::unordered_map<EntityType, ComparisonFunction> comparisonFunctions_;
};

} // namespace sqliteorm
