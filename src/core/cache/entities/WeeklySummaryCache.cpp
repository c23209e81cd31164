#include "trainsync/core/cache/entities/WeeklySummaryCache.hpp"
#include <stdexcept>

namespace trainsync {
namespace core {
namespace cache {

nlohmann::json WeeklySummaryCacheData::toJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& entry : summaries) {
        list.push_back(entry.second.toJson());
    }
    return {
        {"summaries", list},
        {"last_fetched_week", lastFetchedWeek ? nlohmann::json(*lastFetchedWeek) : nlohmann::json(nullptr)}
    };
}

WeeklySummaryCacheData WeeklySummaryCacheData::fromJson(const nlohmann::json& j) {
    WeeklySummaryCacheData data;
    for (const auto& item : j.at("summaries")) {
        auto summary = model::WeeklySummary::fromJson(item);
        if (!data.summaries.emplace(summary.weekNumber, summary).second) {
            throw std::invalid_argument("duplicate summary for week " + std::to_string(summary.weekNumber));
        }
    }
    const auto& last = j.at("last_fetched_week");
    if (!last.is_null()) {
        data.lastFetchedWeek = last.get<int>();
    }
    return data;
}

WeeklySummaryCache::WeeklySummaryCache(std::shared_ptr<storage::KeyValueStore> store,
                                       std::shared_ptr<const time::Clock> clock,
                                       const CacheConfig& config)
    : EntityCache(identities::kWeeklySummary, std::move(store), std::move(clock), config) {}

bool WeeklySummaryCache::saveSummary(const model::WeeklySummary& summary) {
    return update([&summary](WeeklySummaryCacheData& data) {
        data.summaries[summary.weekNumber] = summary;
        data.lastFetchedWeek = summary.weekNumber;
    });
}

std::optional<model::WeeklySummary> WeeklySummaryCache::loadSummary(int week) {
    auto data = snapshot();
    if (!data) {
        return std::nullopt;
    }
    auto it = data->summaries.find(week);
    if (it == data->summaries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> WeeklySummaryCache::lastFetchedWeek() {
    auto data = snapshot();
    return data ? data->lastFetchedWeek : std::nullopt;
}

} // namespace cache
} // namespace core
} // namespace trainsync
