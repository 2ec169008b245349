/**
 * @file change_detector.cpp
 * @brief Implementation of ChangeDetector
 */

#include "sqliteorm/change_detector.hpp"

namespace sqliteorm {

void ChangeDetector::registerComparisonFunction(const EntityType& type, ComparisonFunction function) {
    if (!function) {
        throw OrmException(std::string("Empty comparison function for ") + type.name());
    }
    comparisonFunctions_[type] = std::move(function);
}

bool ChangeDetector::hasComparisonFunction(const EntityType& type) const {
    return comparisonFunctions_.count(type) > 0;
}

bool ChangeDetector::hasChanged(const Entity& snapshot, const Entity& current) const {
    auto it = comparisonFunctions_.find(entityTypeOf(current));
    if (it != comparisonFunctions_.end()) {
        return !it->second(snapshot, current);
    }
    return fieldsDiffer(snapshot.snapshotFields(), current.snapshotFields());
}

bool ChangeDetector::fieldsDiffer(const FieldMap& original, const FieldMap& current) {
    if (original.size() != current.size()) {
        return true;
    }

    for (const auto& [name, value] : original) {
        auto it = current.find(name);
        if (it == current.end() || it->second != value) {
            return true;
        }
    }
    return false;
}

} // namespace sqliteorm
