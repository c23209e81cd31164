#include "trainsync/core/cache/entities/TrainingPlanCache.hpp"
#include <stdexcept>

namespace trainsync {
namespace core {
namespace cache {

nlohmann::json TrainingPlanCacheData::toJson() const {
    nlohmann::json plans = nlohmann::json::object();
    for (const auto& [week, plan] : weeklyPlans) {
        plans[std::to_string(week)] = plan.toJson();
    }
    nlohmann::json captured = nlohmann::json::object();
    for (const auto& [week, capturedAt] : weekCapturedAt) {
        captured[std::to_string(week)] = capturedAt;
    }
    return {
        {"weekly_plans", plans},
        {"week_captured_at_ms", captured},
        {"overview", overview ? overview->toJson() : nlohmann::json(nullptr)}
    };
}

namespace {
int parseWeekKey(const std::string& key) {
    size_t consumed = 0;
    int week = std::stoi(key, &consumed);
    if (consumed != key.size()) {
        throw std::invalid_argument("week key '" + key + "' is not an integer");
    }
    return week;
}
} // namespace

TrainingPlanCacheData TrainingPlanCacheData::fromJson(const nlohmann::json& j) {
    TrainingPlanCacheData data;
    for (const auto& [key, value] : j.at("weekly_plans").items()) {
        data.weeklyPlans.emplace(parseWeekKey(key), model::WeeklyPlan::fromJson(value));
    }
    // Записи без времени недели считаются устаревшими
    if (j.contains("week_captured_at_ms")) {
        for (const auto& [key, value] : j.at("week_captured_at_ms").items()) {
            if (!value.is_number_integer()) {
                throw std::invalid_argument("capture time of week '" + key + "' is not an integer");
            }
            data.weekCapturedAt.emplace(parseWeekKey(key), value.get<time::EpochMillis>());
        }
    }
    const auto& overview = j.at("overview");
    if (!overview.is_null()) {
        data.overview = model::TrainingPlanOverview::fromJson(overview);
    }
    return data;
}

TrainingPlanCache::TrainingPlanCache(std::shared_ptr<storage::KeyValueStore> store,
                                     std::shared_ptr<const time::Clock> clock,
                                     const CacheConfig& config)
    : EntityCache(identities::kTrainingPlan, std::move(store), std::move(clock), config) {}

bool TrainingPlanCache::saveWeeklyPlan(const model::WeeklyPlan& plan) {
    const auto now = nowMillis();
    return update([&plan, now](TrainingPlanCacheData& data) {
        data.weeklyPlans[plan.weekOfPlan] = plan;
        data.weekCapturedAt[plan.weekOfPlan] = now;
    });
}

bool TrainingPlanCache::isWeekStale(int week) {
    auto data = snapshot();
    if (!data || data->weeklyPlans.count(week) == 0) {
        return true;
    }
    auto captured = data->weekCapturedAt.find(week);
    if (captured == data->weekCapturedAt.end()) {
        return true;
    }
    return std::chrono::milliseconds(nowMillis() - captured->second) > ttl();
}

std::optional<model::WeeklyPlan> TrainingPlanCache::loadWeeklyPlan(int week) {
    auto data = snapshot();
    if (!data) {
        return std::nullopt;
    }
    auto it = data->weeklyPlans.find(week);
    if (it == data->weeklyPlans.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TrainingPlanCache::saveOverview(const model::TrainingPlanOverview& overview) {
    return update([&overview](TrainingPlanCacheData& data) {
        // Другой план: недели старого плана больше не действительны
        if (data.overview && data.overview->id != overview.id) {
            data.weeklyPlans.clear();
            data.weekCapturedAt.clear();
        }
        data.overview = overview;
    });
}

std::optional<model::TrainingPlanOverview> TrainingPlanCache::loadOverview() {
    auto data = snapshot();
    return data ? data->overview : std::nullopt;
}

std::vector<int> TrainingPlanCache::cachedWeeks() {
    std::vector<int> weeks;
    auto data = snapshot();
    if (data) {
        for (const auto& entry : data->weeklyPlans) {
            weeks.push_back(entry.first);
        }
    }
    return weeks;
}

} // namespace cache
} // namespace core
} // namespace trainsync
