#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "trainsync/core/cache/Cacheable.hpp"
#include "trainsync/core/cache/entities/TrainingPlanCache.hpp"
#include "trainsync/core/cache/manager/CacheEventBus.hpp"
#include "trainsync/core/plan/BackgroundWork.hpp"
#include "trainsync/core/plan/PlanService.hpp"
#include "trainsync/core/plan/PlanSyncState.hpp"
#include "trainsync/core/task/TaskCoordinator.hpp"
#include "trainsync/core/time/Clock.hpp"

namespace trainsync {
namespace core {
namespace plan {

// Имена задач контроллера
namespace tasks {
constexpr const char* kLoadWeeklyPlan = "load_weekly_plan";
constexpr const char* kGenerateNextWeek = "generate_next_week";
std::string loadWeek(int week); // "load_weekly_plan_week_<n>"
} // namespace tasks

// Зависимости контроллера (все обязательны)
struct PlanSyncDependencies {
    std::shared_ptr<PlanService> service;
    std::shared_ptr<cache::TrainingPlanCache> cache;
    std::shared_ptr<cache::CacheEventBus> bus;
    std::shared_ptr<thread::ThreadPool> pool;
    std::shared_ptr<const time::Clock> clock;
    std::shared_ptr<BackgroundWorkProvider> backgroundWork;
};

// PlanSyncController - машина состояний недельного плана: offline-first чтение из кэша,
// фоновое обновление, выбор недели, генерация следующей недели.
// Перед освобождением последней ссылки владелец обязан вызвать shutdown().
class PlanSyncController : public cache::CacheEventListener,
                           public std::enable_shared_from_this<PlanSyncController> {
public:
    // Результат операции: true = завершена, false = ошибка отражена в state(), nullopt = отменена
    using SyncFuture = std::future<std::optional<bool>>;
    using StateObserver = std::function<void(const PlanSyncState&)>;

    static std::shared_ptr<PlanSyncController> create(PlanSyncDependencies deps); // Регистрирует слушателя в bus
    ~PlanSyncController() override;

    SyncFuture initialize();                   // Холодный старт
    SyncFuture refresh();                      // Ручное обновление выбранной недели
    SyncFuture selectWeek(int week);           // Выбор недели
    SyncFuture generateNextWeek(int targetWeek); // Генерация недели на сервере
    void shutdown();                           // cancelAll + ожидание задач

    PlanSyncState state() const;
    int selectedWeek() const;
    int currentTrainingWeek() const;
    int totalWeeks() const;
    std::vector<int> availableWeeks() const;   // [1, currentTrainingWeek]
    std::optional<ErrorInfo> lastSyncError() const;
    void setStateObserver(StateObserver observer); // Вызывается после каждого изменения

    void onCacheInvalidated(const cache::InvalidationReason& reason) override;

private:
    explicit PlanSyncController(PlanSyncDependencies deps);

    SyncFuture startLoad(const std::string& taskId, std::optional<int> week);
    bool runLoad(std::optional<int> requestedWeek, const task::CancellationToken& token);
    bool runGenerate(int targetWeek, const task::CancellationToken& token);
    model::TrainingPlanOverview ensureOverview(const task::CancellationToken& token);
    void writeThrough(const model::WeeklyPlan& plan);
    bool applyFailure(int week, const ErrorInfo& error, bool notFoundMeansNoPlan);
    void recomputeWeeksLocked();
    PlanSyncFacts factsLocked() const;
    void publish();
    static SyncFuture readyFuture(std::optional<bool> value);

    PlanSyncDependencies deps_;
    std::unique_ptr<task::TaskCoordinator> coordinator_;

    mutable std::mutex mutex_; // Защищает поля ниже; не удерживается при вызовах bus/service
    std::optional<model::TrainingPlanOverview> overview_;
    std::optional<model::WeeklyPlan> plan_;
    FetchPhase phase_ = FetchPhase::Idle;
    std::optional<ErrorInfo> error_;
    std::optional<ErrorInfo> lastSyncError_;
    int selectedWeek_ = 1;
    bool weekChosenByUser_ = false;
    int currentTrainingWeek_ = 1;
    int totalWeeks_ = 0;
    bool shutdown_ = false;

    std::recursive_mutex observerMutex_; // Упорядочивает уведомления
    StateObserver observer_;
};

} // namespace plan
} // namespace core
} // namespace trainsync
