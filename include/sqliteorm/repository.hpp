/**
 * @file repository.hpp
 * @brief Collection-like access to one entity type
 *
 * A Repository pairs a data mapper with a unit of work. Business code sees
 * a collection of entities; the repository decides when to hit the table
 * and makes sure every loaded entity is managed:
 *
 *   Repository<User> users(uow, std::make_shared<UserMapper>(*conn));
 *
 *   auto user = users.getById(int64_t{7});   // managed, or nullptr
 *   user->email = "new@example.com";         // detected at commit
 *
 *   users.add(std::make_shared<User>("carol"));
 *   uow.commit();
 *
 * Writes never happen here. add() and remove() only schedule; the unit of
 * work performs them on commit().
 */

#pragma once

#include <memory>
#include <vector>
#include "sql_data_mapper.hpp"
#include "unit_of_work.hpp"

namespace sqliteorm {

template<typename T, typename Mapper = SqlDataMapper<T>>
class Repository {
public:
    /**
     * @brief Registers mapper with the unit of work for T
     */
    Repository(UnitOfWork& unitOfWork, std::shared_ptr<Mapper> mapper)
        : unitOfWork_(unitOfWork)
        , mapper_(std::move(mapper))
    {
        unitOfWork_.template registerDataMapper<T>(mapper_);
    }

    virtual ~Repository() = default;

    /**
     * @brief Schedule entity for insertion on the next commit
     */
    void add(const std::shared_ptr<T>& entity) {
        unitOfWork_.scheduleForInsertion(entity);
    }

    /**
     * @brief Schedule entity for deletion on the next commit
     */
    void remove(const std::shared_ptr<T>& entity) {
        unitOfWork_.scheduleForDeletion(entity);
    }

    /**
     * @brief Every row of the table, as managed entities
     *
     * Rows whose entity is already managed come back as that instance,
     * including any uncommitted changes made to it.
     */
    std::vector<std::shared_ptr<T>> getAll() {
        std::vector<std::shared_ptr<T>> entities;
        for (const auto& loaded : mapper_->findAll()) {
            entities.push_back(unitOfWork_.manage(loaded));
        }
        return entities;
    }

    /**
     * @return The managed entity with that Id, or nullptr if no row has it
     */
    std::shared_ptr<T> getById(const Value& id) {
        if (auto managed = unitOfWork_.template getManagedEntity<T>(id)) {
            return managed;
        }

        std::shared_ptr<T> loaded = mapper_->findById(id);
        if (!loaded) {
            return nullptr;
        }
        return unitOfWork_.manage(loaded);
    }

    Mapper& getDataMapper() { return *mapper_; }

    UnitOfWork& getUnitOfWork() { return unitOfWork_; }

protected:
    UnitOfWork& unitOfWork_;
    std::shared_ptr<Mapper> mapper_;
};

} // namespace sqliteorm
