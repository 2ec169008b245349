/**
 * @file unit_of_work.hpp
 * @brief Tracks entity changes and persists them in one transaction
 *
 * The unit of work sits between application code and the store:
 *
 *   UnitOfWork uow(*conn);
 *   uow.registerDataMapper<User>(std::make_shared<UserMapper>(*conn));
 *
 *   auto alice = std::make_shared<User>("alice");
 *   uow.scheduleForInsertion(alice);
 *
 *   auto bob = uow.manage(loadedBob);   // always use the returned instance
 *   bob->name = "robert";              // detected at commit
 *
 *   uow.commit();                      // INSERT alice, UPDATE bob, atomically
 *
 * commit() runs change detection over every managed entity, calls
 * preCommit(), opens a transaction and writes in three fixed phases
 * (inserts, then updates, then deletes). On success it calls postCommit()
 * and clears the schedules. On any failure it rolls back, calls
 * postRollback() and throws CommitException with the original cause; the
 * schedules are kept so the commit can be retried.
 *
 * One instance serves one logical unit of work (a request, a batch job).
 * It has no internal locking and must not be shared between threads.
 */

#pragma once

#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>
#include "aggregate_roots.hpp"
#include "change_detector.hpp"
#include "connection.hpp"
#include "data_mapper.hpp"
#include "entity.hpp"
#include "identity_map.hpp"
#include "schedule_set.hpp"
#include "transaction.hpp"

namespace sqliteorm {

struct UnitOfWorkOptions {
    // Locking strategy of the commit transaction
    TransactionType transactionType = TransactionType::Deferred;

    // Scan managed entities for changes at commit; when false only
    // explicitly scheduled updates are written
    bool detectChanges = true;
};

/**
 * @brief Where the most recent commit() got to
 */
enum class CommitStage {
    Idle,           // No commit attempted since construction or dispose()
    Checking,       // Change detection
    PreCommit,      // preCommit() hook
    InTransaction,  // Writes in progress
    Committed,
    RolledBack
};

const char* toString(CommitStage stage);

namespace detail {
    // Keeps a parameter out of template argument deduction
    template<typename T>
    struct NonDeduced { using type = T; };
} // namespace detail

class UnitOfWork {
public:
    explicit UnitOfWork(Connection& connection,
                        const UnitOfWorkOptions& options = UnitOfWorkOptions{});

    virtual ~UnitOfWork() = default;

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    // ========== Commit ==========

    /**
     * @brief Persist every scheduled and detected change atomically
     * @throws CommitException if anything fails once the transaction is
     *         being opened; the transaction is rolled back first
     */
    void commit();

    /**
     * @brief Forget everything tracked; the store is not touched
     *
     * Registered data mappers and comparison functions are kept.
     */
    void dispose();

    // ========== Identity map ==========

    /**
     * @brief Start tracking an entity
     * @return The canonical instance. If an entity of the same type and Id
     *         is already managed, that instance is returned and the argument
     *         is not tracked; callers must continue with the returned value.
     * @throws OrmException if entity is null
     */
    EntityPtr manage(const EntityPtr& entity);

    template<typename T>
    std::shared_ptr<T> manage(const std::shared_ptr<T>& entity) {
        return std::static_pointer_cast<T>(manage(EntityPtr(entity)));
    }

    std::vector<EntityPtr> manageEntities(const std::vector<EntityPtr>& entities);

    /**
     * @brief Stop tracking an entity
     *
     * Drops its snapshot, schedule entries and aggregate-root links. Does
     * nothing unless the entity is Added or Managed.
     */
    void detach(const Entity& entity);

    /**
     * @return The managed entity of that type and Id, or nullptr
     */
    EntityPtr getManagedEntity(const EntityType& type, const Value& id) const;

    template<typename T>
    std::shared_ptr<T> getManagedEntity(const Value& id) const {
        return std::static_pointer_cast<T>(getManagedEntity(entityTypeOf<T>(), id));
    }

    EntityState getEntityState(const Entity& entity) const;

    /**
     * @return The copy change detection compares entity against, or nullptr
     *         if the entity has none
     */
    const Entity* getSnapshot(const Entity& entity) const;

    bool isManaged(const Entity& entity) const;

    // ========== Scheduling ==========

    /**
     * @brief Schedule an insert; the entity becomes Added
     */
    void scheduleForInsertion(const EntityPtr& entity);
    void scheduleForUpdate(const EntityPtr& entity);
    void scheduleForDeletion(const EntityPtr& entity);

    std::vector<EntityPtr> getScheduledEntityInsertions() const;
    std::vector<EntityPtr> getScheduledEntityUpdates() const;
    std::vector<EntityPtr> getScheduledEntityDeletions() const;

    // ========== Registration ==========

    /**
     * @brief Run propagate(parent, child) right before child is written
     * @throws InvalidAggregateLinkException on a malformed link
     */
    void registerAggregateRootChild(const EntityPtr& parent, const EntityPtr& child,
                                    PropagateFunction propagate);

    template<typename P, typename C>
    void registerAggregateRootChild(const std::shared_ptr<P>& parent,
                                    const std::shared_ptr<C>& child,
                                    typename detail::NonDeduced<std::function<void(const P&, C&)>>::type propagate) {
        PropagateFunction erased;
        if (propagate) {
            erased = [fn = std::move(propagate)](const Entity& p, Entity& c) {
                fn(static_cast<const P&>(p), static_cast<C&>(c));
            };
        }
        registerAggregateRootChild(EntityPtr(parent), EntityPtr(child), std::move(erased));
    }

    /**
     * @brief Replace structural change detection for one type
     *
     * function(snapshot, current) returns true when nothing changed.
     */
    void registerComparisonFunction(const EntityType& type, ComparisonFunction function);

    template<typename T>
    void registerComparisonFunction(std::function<bool(const T&, const T&)> function) {
        ComparisonFunction erased;
        if (function) {
            erased = [fn = std::move(function)](const Entity& a, const Entity& b) {
                return fn(static_cast<const T&>(a), static_cast<const T&>(b));
            };
        }
        registerComparisonFunction(entityTypeOf<T>(), std::move(erased));
    }

    void registerDataMapper(const EntityType& type, std::shared_ptr<DataMapper> mapper);

    template<typename T>
    void registerDataMapper(std::shared_ptr<DataMapper> mapper) {
        registerDataMapper(entityTypeOf<T>(), std::move(mapper));
    }

    /**
     * @throws UnmappedTypeException if no mapper is registered for type
     */
    DataMapper& getDataMapper(const EntityType& type) const;

    template<typename T>
    DataMapper& getDataMapper() const {
        return getDataMapper(entityTypeOf<T>());
    }

    // ========== Accessors ==========

    CommitStage stage() const { return stage_; }

    Connection& connection() { return connection_; }

    const UnitOfWorkOptions& options() const { return options_; }

protected:
    /**
     * @brief Runs after change detection, before the transaction opens
     */
    virtual void preCommit();

    /**
     * @brief Runs after the transaction committed
     *
     * Refreshes snapshots of written entities and publishes cached mappers.
     * Every cached mapper is published even if another one throws; the first
     * failure is rethrown afterwards. The commit stays Committed either way.
     * Overrides must call the base implementation.
     */
    virtual void postCommit();

    /**
     * @brief Runs after the transaction was rolled back
     *
     * Returns every scheduled insertion to Added with an empty Id, restores
     * entities deleted during the attempt, and discards staged cache
     * writes. Overrides must call the base implementation.
     */
    virtual void postRollback();

private:
    void checkForUpdates();
    void applyDeletionPrecedence();
    void insert();
    void update();
    void remove();
    void clearCommittedWork();

    bool hasEmptyId(const Entity& entity) const;
    void takeSnapshot(const Entity& entity);
    void requireEntity(const EntityPtr& entity, const char* operation) const;

    Connection& connection_;
    UnitOfWorkOptions options_;

    DataMapperRegistry dataMappers_;
    ChangeDetector changeDetector_;
    DependencyResolver aggregateRoots_;
    IdentityMap identityMap_;

    ScheduleSet scheduledForInsertion_;
    ScheduleSet scheduledForUpdate_;
    ScheduleSet scheduledForDeletion_;

    std::unordered_map<EntityToken, std::unique_ptr<Entity>> snapshots_;
    std::unordered_map<EntityToken, EntityState> entityStates_;

    struct DeletedEntity {
        EntityPtr entity;
        EntityState previousState;
    };

    // Entities deleted during the current commit attempt
    std::vector<DeletedEntity> deletedInTransaction_;

    CommitStage stage_ = CommitStage::Idle;
};

} // namespace sqliteorm
