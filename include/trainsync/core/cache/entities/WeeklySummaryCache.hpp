#pragma once

#include <map>
#include <optional>
#include "trainsync/core/cache/entities/EntityCache.hpp"
#include "trainsync/core/model/WeeklySummary.hpp"

namespace trainsync {
namespace core {
namespace cache {

struct WeeklySummaryCacheData {
    std::map<int, model::WeeklySummary> summaries;
    std::optional<int> lastFetchedWeek;

    nlohmann::json toJson() const;
    static WeeklySummaryCacheData fromJson(const nlohmann::json& j);
};

// WeeklySummaryCache - кэш "weekly_summary"
class WeeklySummaryCache : public EntityCache<WeeklySummaryCacheData> {
public:
    WeeklySummaryCache(std::shared_ptr<storage::KeyValueStore> store,
                       std::shared_ptr<const time::Clock> clock,
                       const CacheConfig& config);

    bool saveSummary(const model::WeeklySummary& summary); // Обновляет lastFetchedWeek
    std::optional<model::WeeklySummary> loadSummary(int week);
    std::optional<int> lastFetchedWeek();
};

} // namespace cache
} // namespace core
} // namespace trainsync
