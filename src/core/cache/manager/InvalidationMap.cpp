#include "trainsync/core/cache/manager/InvalidationMap.hpp"

namespace trainsync {
namespace core {
namespace cache {

InvalidationMap::InvalidationMap() {
    for (auto domain : allDataDomains()) {
        table_[domain] = {};
    }
}

InvalidationMap::InvalidationMap(std::initializer_list<Entry> entries)
    : InvalidationMap() {
    for (const auto& entry : entries) {
        table_[entry.first] = entry.second;
    }
}

const InvalidationMap& InvalidationMap::standard() {
    static const InvalidationMap map = [] {
        using namespace identities;
        InvalidationMap m{
            {DataDomain::Workouts, {kWorkouts, kWorkoutUpload}},
            {DataDomain::TrainingPlan, {kTrainingPlan, kWeeklySummary}}, // План влияет на недельный итог
            {DataDomain::WeeklySummary, {kWeeklySummary}},
            {DataDomain::Targets, {kTargets, kTrainingPlan}},            // Цели влияют на план
            {DataDomain::HealthData, {kHealthData, kHrv}},
            {DataDomain::Hrv, {kHrv, kHealthData}},
            {DataDomain::Vdot, {kVdot}}
        };
        // Смена пользователя затрагивает все известные кэши
        m.set(DataDomain::User, m.allIdentities());
        return m;
    }();
    return map;
}

const std::set<CacheIdentity>& InvalidationMap::affected(DataDomain domain) const {
    return table_.at(domain);
}

void InvalidationMap::set(DataDomain domain, std::set<CacheIdentity> identities) {
    table_[domain] = std::move(identities);
}

bool InvalidationMap::references(const CacheIdentity& identity) const {
    for (const auto& [domain, identities] : table_) {
        if (identities.count(identity) > 0) {
            return true;
        }
    }
    return false;
}

std::set<CacheIdentity> InvalidationMap::allIdentities() const {
    std::set<CacheIdentity> all;
    for (const auto& [domain, identities] : table_) {
        all.insert(identities.begin(), identities.end());
    }
    return all;
}

} // namespace cache
} // namespace core
} // namespace trainsync
