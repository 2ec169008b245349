/**
 * @file data_mapper.cpp
 * @brief Implementation of IntegerIdGenerator and DataMapperRegistry
 */

#include "sqliteorm/data_mapper.hpp"
#include "sqliteorm/connection.hpp"

namespace sqliteorm {

Value IntegerIdGenerator::generate(const Entity&, Connection& connection) {
    return connection.lastInsertRowId();
}

void DataMapperRegistry::registerMapper(const EntityType& type, std::shared_ptr<DataMapper> mapper) {
    if (!mapper) {
        throw OrmException(std::string("Null data mapper for ") + type.name());
    }
    mappers_[type] = std::move(mapper);
}

DataMapper& DataMapperRegistry::get(const EntityType& type) const {
    DataMapper* mapper = find(type);
    if (mapper == nullptr) {
        throw UnmappedTypeException(type.name());
    }
    return *mapper;
}

DataMapper* DataMapperRegistry::find(const EntityType& type) const noexcept {
    auto it = mappers_.find(type);
    return it != mappers_.end() ? it->second.get() : nullptr;
}

bool DataMapperRegistry::contains(const EntityType& type) const {
    return mappers_.count(type) > 0;
}

std::vector<CachedDataMapper*> DataMapperRegistry::cachedMappers() const {
    std::vector<CachedDataMapper*> result;
    for (const auto& item : mappers_) {
        if (auto* cached = dynamic_cast<CachedDataMapper*>(item.second.get())) {
            result.push_back(cached);
        }
    }
    return result;
}

} // namespace sqliteorm
