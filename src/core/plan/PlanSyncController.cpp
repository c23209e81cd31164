#include "trainsync/core/plan/PlanSyncController.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "trainsync/core/logging/Logging.hpp"
#include "trainsync/core/plan/TrainingWeeks.hpp"

namespace trainsync {
namespace core {
namespace plan {

namespace tasks {
std::string loadWeek(int week) {
    return std::string(kLoadWeeklyPlan) + "_week_" + std::to_string(week);
}
} // namespace tasks

namespace {
std::shared_ptr<spdlog::logger> logger() {
    return logging::getLogger("plansync");
}
} // namespace

std::shared_ptr<PlanSyncController> PlanSyncController::create(PlanSyncDependencies deps) {
    if (!deps.service || !deps.cache || !deps.bus || !deps.pool || !deps.clock || !deps.backgroundWork) {
        throw std::invalid_argument("PlanSyncController: missing dependency");
    }
    std::shared_ptr<PlanSyncController> controller(new PlanSyncController(std::move(deps)));
    controller->deps_.bus->addListener(controller);
    return controller;
}

PlanSyncController::PlanSyncController(PlanSyncDependencies deps)
    : deps_(std::move(deps)),
      coordinator_(std::make_unique<task::TaskCoordinator>("PlanSyncController", deps_.pool)) {}

PlanSyncController::~PlanSyncController() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shutdown_) {
        logger()->warn("PlanSyncController destroyed without shutdown(), pending tasks are canceled");
    }
}

PlanSyncController::SyncFuture PlanSyncController::readyFuture(std::optional<bool> value) {
    std::promise<std::optional<bool>> promise;
    promise.set_value(value);
    return promise.get_future();
}

PlanSyncController::SyncFuture PlanSyncController::initialize() {
    auto overview = deps_.cache->loadOverview();
    std::optional<int> week;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return readyFuture(std::nullopt);
        }
        overview_ = overview;
        recomputeWeeksLocked();
        if (overview_) {
            selectedWeek_ = currentTrainingWeek_;
            week = selectedWeek_;
        }
    }

    std::optional<model::WeeklyPlan> cached;
    if (week) {
        cached = deps_.cache->loadWeeklyPlan(*week);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        plan_ = cached;
        phase_ = FetchPhase::Loading;
        error_.reset();
    }
    logger()->info("Холодный старт: неделя {}, кэш {}", week ? std::to_string(*week) : std::string("?"),
                   cached ? "есть" : "пуст");
    publish();
    return startLoad(tasks::kLoadWeeklyPlan, week);
}

PlanSyncController::SyncFuture PlanSyncController::refresh() {
    int week = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return readyFuture(std::nullopt);
        }
        week = selectedWeek_;
        phase_ = FetchPhase::Loading;
    }
    publish();
    return startLoad(tasks::kLoadWeeklyPlan, week);
}

PlanSyncController::SyncFuture PlanSyncController::selectWeek(int week) {
    if (week < 1) {
        logger()->warn("selectWeek({}) rejected: weeks start at 1", week);
        return readyFuture(false);
    }
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return readyFuture(std::nullopt);
        }
        selectedWeek_ = week;
        weekChosenByUser_ = true;
        plan_.reset();
        error_.reset();
        phase_ = FetchPhase::Idle;
        completed = totalWeeks_ > 0 && week > totalWeeks_;
    }
    if (completed) {
        publish();
        return readyFuture(true);
    }

    auto cached = deps_.cache->loadWeeklyPlan(week);
    const bool stale = cached && deps_.cache->isWeekStale(week);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (selectedWeek_ != week) {
            // Пока читали кэш, выбрали другую неделю
            return readyFuture(std::nullopt);
        }
        plan_ = cached;
        if (!cached) {
            phase_ = FetchPhase::Loading;
        }
    }
    publish();

    if (cached && !stale) {
        return readyFuture(true);
    }
    if (cached) {
        logger()->debug("Неделя {} из кэша устарела, обновляем в фоне", week);
    }
    return startLoad(tasks::loadWeek(week), week);
}

PlanSyncController::SyncFuture PlanSyncController::generateNextWeek(int targetWeek) {
    if (targetWeek < 1) {
        logger()->warn("generateNextWeek({}) rejected: weeks start at 1", targetWeek);
        return readyFuture(false);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return readyFuture(std::nullopt);
        }
    }
    auto self = shared_from_this();
    return coordinator_->execute<bool>(tasks::kGenerateNextWeek,
        [self, targetWeek](const task::CancellationToken& token) {
            return self->runGenerate(targetWeek, token);
        });
}

void PlanSyncController::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    coordinator_->cancelAll();
    coordinator_->waitForIdle();
    logger()->debug("PlanSyncController shut down");
}

PlanSyncController::SyncFuture PlanSyncController::startLoad(const std::string& taskId, std::optional<int> week) {
    auto self = shared_from_this();
    return coordinator_->execute<bool>(taskId,
        [self, week](const task::CancellationToken& token) {
            return self->runLoad(week, token);
        });
}

model::TrainingPlanOverview PlanSyncController::ensureOverview(const task::CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (overview_) {
            return *overview_;
        }
    }
    auto overview = deps_.cache->loadOverview();
    if (!overview) {
        token.throwIfCancelled();
        overview = deps_.service->fetchOverview(token);
        token.throwIfCancelled();
        if (!deps_.cache->saveOverview(*overview)) {
            logger()->warn("Overview '{}' not persisted, continuing with in-memory copy", overview->id);
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    overview_ = overview;
    recomputeWeeksLocked();
    return *overview;
}

void PlanSyncController::writeThrough(const model::WeeklyPlan& plan) {
    if (!deps_.cache->saveWeeklyPlan(plan)) {
        logger()->warn("План недели {} не сохранен в кэш", plan.weekOfPlan);
    }
    // Зависимые кэши очищаются, только что записанный - нет
    deps_.bus->invalidate(cache::InvalidationReason::dataChanged(cache::DataDomain::TrainingPlan),
                          cache::identities::kTrainingPlan);
}

bool PlanSyncController::runLoad(std::optional<int> requestedWeek, const task::CancellationToken& token) {
    token.throwIfCancelled();
    std::string step = steps::kFetchOverview;
    int week = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        week = requestedWeek.value_or(selectedWeek_);
    }
    try {
        auto overview = ensureOverview(token);

        bool completed = false;
        bool needCachedPlan = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!requestedWeek) {
                if (!weekChosenByUser_) {
                    selectedWeek_ = currentTrainingWeek_;
                }
                week = selectedWeek_;
            }
            completed = totalWeeks_ > 0 && week > totalWeeks_;
            needCachedPlan = !plan_ && selectedWeek_ == week;
        }
        if (completed) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (selectedWeek_ == week) {
                    phase_ = FetchPhase::Idle;
                }
            }
            publish();
            return true;
        }
        if (needCachedPlan) {
            // Неделя стала известна только после обзора: сначала показываем кэш
            auto cached = deps_.cache->loadWeeklyPlan(week);
            if (cached) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (selectedWeek_ == week && !plan_) {
                    plan_ = cached;
                }
            }
            publish();
        }

        step = steps::kFetchPlan;
        token.throwIfCancelled();
        auto plan = deps_.service->fetchPlan(model::makeWeeklyPlanId(overview.id, week), token);
        token.throwIfCancelled();
        if (plan.weekOfPlan != week) {
            logger()->warn("Plan '{}' reports week {}, expected {}", plan.id, plan.weekOfPlan, week);
        }
        writeThrough(plan);
        token.throwIfCancelled();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (selectedWeek_ != week) {
                logger()->debug("Неделя {} загружена, но выбрана {}: не публикуем", week, selectedWeek_);
                return true;
            }
            plan_ = plan;
            phase_ = FetchPhase::Idle;
            error_.reset();
            lastSyncError_.reset();
        }
        logger()->info("План недели {} обновлен", week);
        publish();
        return true;
    } catch (const task::OperationCanceled&) {
        throw;
    } catch (const ServiceError& e) {
        if (token.isCancelled()) {
            throw task::OperationCanceled();
        }
        return applyFailure(week, ErrorInfo{e.kind(), e.what(), step}, true);
    } catch (const std::exception& e) {
        if (token.isCancelled()) {
            throw task::OperationCanceled();
        }
        return applyFailure(week, ErrorInfo{ErrorKind::Unknown, e.what(), step}, true);
    }
}

bool PlanSyncController::runGenerate(int targetWeek, const task::CancellationToken& token) {
    ScopedBackgroundWork work(*deps_.backgroundWork, tasks::kGenerateNextWeek);
    token.throwIfCancelled(); // Отмененная генерация ничего не публикует
    {
        std::lock_guard<std::mutex> lock(mutex_);
        selectedWeek_ = targetWeek;
        weekChosenByUser_ = true;
        plan_.reset();
        error_.reset();
        phase_ = FetchPhase::Loading;
    }
    publish();

    std::string step = steps::kCreatePlan;
    try {
        token.throwIfCancelled();
        deps_.service->createPlan(targetWeek, token);
        token.throwIfCancelled();

        step = steps::kFetchOverview;
        auto overview = ensureOverview(token);

        step = steps::kFetchPlan;
        auto plan = deps_.service->fetchPlan(model::makeWeeklyPlanId(overview.id, targetWeek), token);
        token.throwIfCancelled();
        writeThrough(plan);
        token.throwIfCancelled();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (selectedWeek_ != targetWeek) {
                return true;
            }
            plan_ = plan;
            phase_ = FetchPhase::Idle;
            lastSyncError_.reset();
        }
        logger()->info("Сгенерирован план недели {}", targetWeek);
        publish();
        return true;
    } catch (const task::OperationCanceled&) {
        throw;
    } catch (const ServiceError& e) {
        if (token.isCancelled()) {
            throw task::OperationCanceled();
        }
        return applyFailure(targetWeek, ErrorInfo{e.kind(), e.what(), step}, false);
    } catch (const std::exception& e) {
        if (token.isCancelled()) {
            throw task::OperationCanceled();
        }
        return applyFailure(targetWeek, ErrorInfo{ErrorKind::Unknown, e.what(), step}, false);
    }
}

bool PlanSyncController::applyFailure(int week, const ErrorInfo& error, bool notFoundMeansNoPlan) {
    const bool notFound = notFoundMeansNoPlan && error.kind == ErrorKind::NotFound;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!notFound) {
            lastSyncError_ = error;
        }
        if (selectedWeek_ != week) {
            return false;
        }
        if (notFound) {
            plan_.reset();
            phase_ = FetchPhase::NotFound;
            error_.reset();
        } else {
            phase_ = FetchPhase::Failed;
            error_ = error;
        }
    }
    if (notFound) {
        logger()->info("Плана для недели {} нет ({})", week, error.message);
    } else {
        logger()->error("Sync of week {} failed at {}: [{}] {}", week, error.step, toString(error.kind), error.message);
    }
    publish();
    return false;
}

void PlanSyncController::onCacheInvalidated(const cache::InvalidationReason& reason) {
    using Kind = cache::InvalidationReason::Kind;
    if (reason.kind != Kind::UserLogout && reason.kind != Kind::ManualClear) {
        return;
    }
    if (reason.kind == Kind::UserLogout) {
        coordinator_->cancelAll();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        overview_.reset();
        plan_.reset();
        error_.reset();
        lastSyncError_.reset();
        if (reason.kind == Kind::UserLogout) {
            phase_ = FetchPhase::Idle;
            weekChosenByUser_ = false;
            selectedWeek_ = 1;
        }
        recomputeWeeksLocked();
    }
    logger()->info("Данные плана в памяти сброшены ({})", reason.toString());
    publish();
}

void PlanSyncController::recomputeWeeksLocked() {
    if (!overview_) {
        currentTrainingWeek_ = 1;
        totalWeeks_ = 0;
        return;
    }
    currentTrainingWeek_ = weeks::currentWeek(overview_->createdAtEpoch, deps_.clock->nowSeconds());
    totalWeeks_ = overview_->totalWeeks;
}

PlanSyncFacts PlanSyncController::factsLocked() const {
    PlanSyncFacts facts;
    facts.plan = plan_;
    facts.phase = phase_;
    facts.error = error_;
    facts.selectedWeek = selectedWeek_;
    facts.totalWeeks = totalWeeks_;
    return facts;
}

void PlanSyncController::publish() {
    std::lock_guard<std::recursive_mutex> observerLock(observerMutex_);
    PlanSyncState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = deriveState(factsLocked());
    }
    logger()->debug("state -> {}", toString(current.status));
    if (observer_) {
        observer_(current);
    }
}

PlanSyncState PlanSyncController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deriveState(factsLocked());
}

int PlanSyncController::selectedWeek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selectedWeek_;
}

int PlanSyncController::currentTrainingWeek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentTrainingWeek_;
}

int PlanSyncController::totalWeeks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalWeeks_;
}

std::vector<int> PlanSyncController::availableWeeks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> weeks;
    for (int week = 1; week <= currentTrainingWeek_; ++week) {
        weeks.push_back(week);
    }
    return weeks;
}

std::optional<ErrorInfo> PlanSyncController::lastSyncError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSyncError_;
}

void PlanSyncController::setStateObserver(StateObserver observer) {
    std::lock_guard<std::recursive_mutex> lock(observerMutex_);
    observer_ = std::move(observer);
}

} // namespace plan
} // namespace core
} // namespace trainsync
