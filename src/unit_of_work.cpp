/**
 * @file unit_of_work.cpp
 * @brief Implementation of UnitOfWork
 */

#include "sqliteorm/unit_of_work.hpp"
#include "sqliteorm/log.hpp"
#include <exception>
#include <optional>

namespace sqliteorm {

namespace {

std::string describe(const std::exception_ptr& cause) {
    try {
        std::rethrow_exception(cause);
    } catch (const DatabaseException& e) {
        // CommitException appends the error code itself
        return e.message();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

int errorCodeOf(const std::exception_ptr& cause) {
    try {
        std::rethrow_exception(cause);
    } catch (const DatabaseException& e) {
        return e.errorCode();
    } catch (...) {
        return 0;
    }
}

} // namespace

const char* toString(CommitStage stage) {
    switch (stage) {
        case CommitStage::Idle:          return "IDLE";
        case CommitStage::Checking:      return "CHECKING";
        case CommitStage::PreCommit:     return "PRE-COMMIT-HOOK";
        case CommitStage::InTransaction: return "IN-TRANSACTION";
        case CommitStage::Committed:     return "COMMITTED";
        case CommitStage::RolledBack:    return "ROLLED-BACK";
    }
    return "IDLE";
}

UnitOfWork::UnitOfWork(Connection& connection, const UnitOfWorkOptions& options)
    : connection_(connection)
    , options_(options)
{}

// ========== Commit ==========

void UnitOfWork::commit() {
    stage_ = CommitStage::Checking;
    checkForUpdates();

    stage_ = CommitStage::PreCommit;
    preCommit();

    applyDeletionPrecedence();
    deletedInTransaction_.clear();

    SQLITEORM_LOG_DEBUG << "Committing " << scheduledForInsertion_.size() << " insertion(s), "
                        << scheduledForUpdate_.size() << " update(s), "
                        << scheduledForDeletion_.size() << " deletion(s)";

    stage_ = CommitStage::InTransaction;
    std::optional<Transaction> transaction;

    try {
        transaction.emplace(connection_.beginTransaction(options_.transactionType));
        insert();
        update();
        remove();
        transaction->commit();
    } catch (...) {
        const std::exception_ptr cause = std::current_exception();

        if (transaction && transaction->isActive()) {
            try {
                transaction->rollback();
            } catch (const DatabaseException& e) {
                SQLITEORM_LOG_ERROR << "Rollback after failed commit failed: " << e.what();
            }
        }

        postRollback();
        stage_ = CommitStage::RolledBack;

        const std::string message = describe(cause);
        SQLITEORM_LOG_ERROR << "Commit rolled back: " << message;
        throw CommitException(message, cause, errorCodeOf(cause));
    }

    // The rows are durable from here on; a failing hook must not reschedule them
    try {
        postCommit();
    } catch (...) {
        clearCommittedWork();
        SQLITEORM_LOG_ERROR << "Post-commit step failed; the transaction stays committed";
        throw;
    }

    clearCommittedWork();
    SQLITEORM_LOG_DEBUG << "Commit succeeded";
}

void UnitOfWork::clearCommittedWork() {
    scheduledForInsertion_.clear();
    scheduledForUpdate_.clear();
    scheduledForDeletion_.clear();
    aggregateRoots_.clear();
    deletedInTransaction_.clear();
    stage_ = CommitStage::Committed;
}

void UnitOfWork::dispose() {
    scheduledForInsertion_.clear();
    scheduledForUpdate_.clear();
    scheduledForDeletion_.clear();
    aggregateRoots_.clear();
    identityMap_.clear();
    entityStates_.clear();
    snapshots_.clear();
    deletedInTransaction_.clear();
    stage_ = CommitStage::Idle;
}

void UnitOfWork::checkForUpdates() {
    if (!options_.detectChanges) {
        return;
    }

    for (const EntityPtr& entity : identityMap_.entities()) {
        const EntityToken token = entity->token();

        if (!isManaged(*entity)
            || scheduledForInsertion_.contains(token)
            || scheduledForUpdate_.contains(token)
            || scheduledForDeletion_.contains(token)) {
            continue;
        }

        auto snapshot = snapshots_.find(token);
        if (snapshot == snapshots_.end()) {
            continue;
        }

        if (changeDetector_.hasChanged(*snapshot->second, *entity)) {
            scheduleForUpdate(entity);
        }
    }
}

void UnitOfWork::applyDeletionPrecedence() {
    for (const EntityPtr& entity : scheduledForDeletion_.entities()) {
        const bool wasInserted = scheduledForInsertion_.erase(entity->token());
        const bool wasUpdated = scheduledForUpdate_.erase(entity->token());
        if (wasInserted || wasUpdated) {
            SQLITEORM_LOG_DEBUG << "Entity " << toString(entity->getId())
                                << " is scheduled for deletion; dropping its other writes";
        }
    }
}

void UnitOfWork::insert() {
    for (const EntityPtr& entity : scheduledForInsertion_.entities()) {
        aggregateRoots_.propagateTo(*entity);

        DataMapper& mapper = getDataMapper(entityTypeOf(*entity));
        mapper.add(*entity);
        entity->setId(mapper.getIdGenerator().generate(*entity, connection_));

        if (manage(entity) != entity) {
            SQLITEORM_LOG_WARN << "Inserted entity " << toString(entity->getId())
                               << " collides with an instance already managed under that Id";
        }
    }
}

void UnitOfWork::update() {
    for (const EntityPtr& entity : scheduledForUpdate_.entities()) {
        aggregateRoots_.propagateTo(*entity);

        DataMapper& mapper = getDataMapper(entityTypeOf(*entity));
        mapper.update(*entity);
        manage(entity);
    }
}

void UnitOfWork::remove() {
    // detach() edits the deletion schedule, so walk a copy
    const std::vector<EntityPtr> targets = scheduledForDeletion_.entities();

    for (const EntityPtr& entity : targets) {
        DataMapper& mapper = getDataMapper(entityTypeOf(*entity));
        mapper.remove(*entity);

        const EntityState previousState = getEntityState(*entity);
        detach(*entity);
        entityStates_[entity->token()] = EntityState::Deleted;
        deletedInTransaction_.push_back({entity, previousState});
    }
}

void UnitOfWork::preCommit() {
}

void UnitOfWork::postCommit() {
    for (const ScheduleSet* written : {&scheduledForInsertion_, &scheduledForUpdate_}) {
        for (const EntityPtr& entity : written->entities()) {
            if (getEntityState(*entity) == EntityState::Managed) {
                takeSnapshot(*entity);
            }
        }
    }

    // The writes are durable now, so caches may show them
    std::exception_ptr firstFailure;
    for (CachedDataMapper* mapper : dataMappers_.cachedMappers()) {
        try {
            mapper->commit();
        } catch (const std::exception& e) {
            SQLITEORM_LOG_ERROR << "Publishing a cached mapper failed: " << e.what();
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
        }
    }

    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
}

void UnitOfWork::postRollback() {
    for (const EntityPtr& entity : scheduledForInsertion_.entities()) {
        DataMapper* mapper = dataMappers_.find(entityTypeOf(*entity));
        if (mapper == nullptr) {
            SQLITEORM_LOG_WARN << "No data mapper for " << entityTypeOf(*entity).name()
                               << "; leaving its Id unchanged";
            continue;
        }

        identityMap_.remove(*entity);
        entity->setId(mapper->getIdGenerator().emptyValue());
        entityStates_[entity->token()] = EntityState::Added;
        takeSnapshot(*entity);
    }

    // Rows deleted in the rolled-back transaction still exist
    for (const DeletedEntity& deleted : deletedInTransaction_) {
        const EntityPtr& entity = deleted.entity;
        const EntityToken token = entity->token();

        if (deleted.previousState == EntityState::Managed
            || deleted.previousState == EntityState::Added) {
            identityMap_.add(entity, !hasEmptyId(*entity));
            entityStates_[token] = deleted.previousState;
            takeSnapshot(*entity);
        } else if (deleted.previousState == EntityState::Unmanaged) {
            entityStates_.erase(token);
        } else {
            entityStates_[token] = deleted.previousState;
        }
        scheduledForDeletion_.add(entity);
    }
    deletedInTransaction_.clear();

    for (CachedDataMapper* mapper : dataMappers_.cachedMappers()) {
        try {
            mapper->discard();
        } catch (const std::exception& e) {
            SQLITEORM_LOG_ERROR << "Discarding a cached mapper failed: " << e.what();
        }
    }
}

// ========== Identity map ==========

EntityPtr UnitOfWork::manage(const EntityPtr& entity) {
    requireEntity(entity, "manage");

    const bool identified = !hasEmptyId(*entity);
    if (identified) {
        if (EntityPtr existing = identityMap_.find(entityTypeOf(*entity), entity->getId())) {
            return existing;
        }
    } else if (identityMap_.contains(*entity)) {
        return entity;
    }

    identityMap_.add(entity, identified);
    entityStates_[entity->token()] = EntityState::Managed;
    takeSnapshot(*entity);
    return entity;
}

std::vector<EntityPtr> UnitOfWork::manageEntities(const std::vector<EntityPtr>& entities) {
    std::vector<EntityPtr> canonical;
    canonical.reserve(entities.size());
    for (const EntityPtr& entity : entities) {
        canonical.push_back(manage(entity));
    }
    return canonical;
}

void UnitOfWork::detach(const Entity& entity) {
    const EntityState state = getEntityState(entity);
    if (state != EntityState::Added && state != EntityState::Managed) {
        return;
    }

    const EntityToken token = entity.token();
    identityMap_.remove(entity);
    snapshots_.erase(token);
    scheduledForInsertion_.erase(token);
    scheduledForUpdate_.erase(token);
    scheduledForDeletion_.erase(token);
    aggregateRoots_.removeLinksFor(entity);
    entityStates_[token] = EntityState::Detached;
}

EntityPtr UnitOfWork::getManagedEntity(const EntityType& type, const Value& id) const {
    return identityMap_.find(type, id);
}

EntityState UnitOfWork::getEntityState(const Entity& entity) const {
    auto it = entityStates_.find(entity.token());
    return it != entityStates_.end() ? it->second : EntityState::Unmanaged;
}

const Entity* UnitOfWork::getSnapshot(const Entity& entity) const {
    auto it = snapshots_.find(entity.token());
    return it != snapshots_.end() ? it->second.get() : nullptr;
}

bool UnitOfWork::isManaged(const Entity& entity) const {
    if (getEntityState(entity) == EntityState::Managed) {
        return true;
    }
    EntityPtr tracked = identityMap_.find(entityTypeOf(entity), entity.getId());
    return tracked.get() == &entity;
}

// ========== Scheduling ==========

void UnitOfWork::scheduleForInsertion(const EntityPtr& entity) {
    requireEntity(entity, "schedule for insertion");

    scheduledForInsertion_.add(entity);
    entityStates_[entity->token()] = EntityState::Added;
    if (snapshots_.count(entity->token()) == 0) {
        takeSnapshot(*entity);
    }
}

void UnitOfWork::scheduleForUpdate(const EntityPtr& entity) {
    requireEntity(entity, "schedule for update");
    scheduledForUpdate_.add(entity);
}

void UnitOfWork::scheduleForDeletion(const EntityPtr& entity) {
    requireEntity(entity, "schedule for deletion");
    scheduledForDeletion_.add(entity);
}

std::vector<EntityPtr> UnitOfWork::getScheduledEntityInsertions() const {
    return scheduledForInsertion_.entities();
}

std::vector<EntityPtr> UnitOfWork::getScheduledEntityUpdates() const {
    return scheduledForUpdate_.entities();
}

std::vector<EntityPtr> UnitOfWork::getScheduledEntityDeletions() const {
    return scheduledForDeletion_.entities();
}

// ========== Registration ==========

void UnitOfWork::registerAggregateRootChild(const EntityPtr& parent, const EntityPtr& child,
                                            PropagateFunction propagate) {
    aggregateRoots_.registerLink(parent, child, std::move(propagate));
}

void UnitOfWork::registerComparisonFunction(const EntityType& type, ComparisonFunction function) {
    changeDetector_.registerComparisonFunction(type, std::move(function));
}

void UnitOfWork::registerDataMapper(const EntityType& type, std::shared_ptr<DataMapper> mapper) {
    dataMappers_.registerMapper(type, std::move(mapper));
}

DataMapper& UnitOfWork::getDataMapper(const EntityType& type) const {
    return dataMappers_.get(type);
}

// ========== Helpers ==========

bool UnitOfWork::hasEmptyId(const Entity& entity) const {
    const Value id = entity.getId();
    if (isNull(id)) {
        return true;
    }
    DataMapper* mapper = dataMappers_.find(entityTypeOf(entity));
    return mapper != nullptr && mapper->getIdGenerator().isEmpty(id);
}

void UnitOfWork::takeSnapshot(const Entity& entity) {
    snapshots_[entity.token()] = entity.clone();
}

void UnitOfWork::requireEntity(const EntityPtr& entity, const char* operation) const {
    if (!entity) {
        throw OrmException(std::string("Cannot ") + operation + " a null entity");
    }
}

} // namespace sqliteorm
