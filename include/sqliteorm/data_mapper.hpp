/**
 * @file data_mapper.hpp
 * @brief Collaborators that physically write one entity type
 *
 * The unit of work never builds SQL. For each entity it asks the data
 * mapper registered for the entity's type to add, update or remove it, and
 * after an insert asks the mapper's IdGenerator for the new Id.
 *
 * A mapper that keeps a cache implements CachedDataMapper. Its cache must
 * only ever show committed data, so the unit of work calls commit() after
 * the transaction commits, and discard() after a rollback.
 */

#pragma once

#include <memory>
#include <unordered_map>
#include <vector>
#include "entity.hpp"

namespace sqliteorm {

class Connection;

/**
 * @brief Produces Ids for newly inserted entities
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /**
     * @brief Id of an entity that has just been added through connection
     */
    virtual Value generate(const Entity& entity, Connection& connection) = 0;

    /**
     * @brief The "no Id yet" value; restored on rolled-back inserts
     */
    virtual Value emptyValue() const = 0;

    bool isEmpty(const Value& id) const {
        return sqliteorm::isNull(id) || id == emptyValue();
    }
};

/**
 * @brief Ids from INTEGER PRIMARY KEY columns (SQLite rowids)
 *
 * Must be asked right after the INSERT, before any other insert on the
 * same connection.
 */
class IntegerIdGenerator : public IdGenerator {
public:
    Value generate(const Entity& entity, Connection& connection) override;
    Value emptyValue() const override { return int64_t{0}; }
};

class DataMapper {
public:
    virtual ~DataMapper() = default;

    virtual void add(Entity& entity) = 0;
    virtual void update(Entity& entity) = 0;
    virtual void remove(Entity& entity) = 0;

    virtual IdGenerator& getIdGenerator() = 0;
};

class CachedDataMapper : public DataMapper {
public:
    /**
     * @brief Publish the writes staged since the last commit()/discard()
     */
    virtual void commit() = 0;

    /**
     * @brief Drop the staged writes of a rolled-back transaction
     */
    virtual void discard() = 0;
};

/**
 * @brief One data mapper per entity type
 */
class DataMapperRegistry {
public:
    /**
     * @brief Bind mapper to type, replacing any previous binding
     * @throws OrmException if mapper is null
     */
    void registerMapper(const EntityType& type, std::shared_ptr<DataMapper> mapper);

    /**
     * @throws UnmappedTypeException if no mapper is bound to type
     */
    DataMapper& get(const EntityType& type) const;

    /**
     * @return The bound mapper, or nullptr
     */
    DataMapper* find(const EntityType& type) const noexcept;

    bool contains(const EntityType& type) const;

    /**
     * @brief Mappers with the caching capability
     */
    std::vector<CachedDataMapper*> cachedMappers() const;

    size_t size() const { return mappers_.size(); }

private:
    std::unordered_map<EntityType, std::shared_ptr<DataMapper>> mappers_;
};

} // namespace sqliteorm
