#pragma once

#include <map>
#include <optional>
#include <vector>
#include "trainsync/core/cache/entities/EntityCache.hpp"
#include "trainsync/core/model/TrainingPlanOverview.hpp"
#include "trainsync/core/model/WeeklyPlan.hpp"

namespace trainsync {
namespace core {
namespace cache {

// Содержимое кэша плана: недельные планы по номеру недели + обзор.
// Каждая неделя хранит собственное время захвата.
struct TrainingPlanCacheData {
    std::map<int, model::WeeklyPlan> weeklyPlans;
    std::map<int, time::EpochMillis> weekCapturedAt;
    std::optional<model::TrainingPlanOverview> overview;

    nlohmann::json toJson() const;
    static TrainingPlanCacheData fromJson(const nlohmann::json& j);
};

// TrainingPlanCache - кэш "training_plan"
class TrainingPlanCache : public EntityCache<TrainingPlanCacheData> {
public:
    TrainingPlanCache(std::shared_ptr<storage::KeyValueStore> store,
                      std::shared_ptr<const time::Clock> clock,
                      const CacheConfig& config);

    bool saveWeeklyPlan(const model::WeeklyPlan& plan);           // Заменяет неделю plan.weekOfPlan
    std::optional<model::WeeklyPlan> loadWeeklyPlan(int week);
    bool saveOverview(const model::TrainingPlanOverview& overview);
    std::optional<model::TrainingPlanOverview> loadOverview();
    std::vector<int> cachedWeeks();                               // По возрастанию
    bool isStale() const { return isExpired(); }                  // Вся запись (для CacheEventBus)
    bool isWeekStale(int week);                                   // Нет недели или старше TTL
};

} // namespace cache
} // namespace core
} // namespace trainsync
