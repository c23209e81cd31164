#include "trainsync/core/cache/CacheTypes.hpp"

namespace trainsync {
namespace core {
namespace cache {

const std::vector<DataDomain>& allDataDomains() {
    static const std::vector<DataDomain> domains = {
        DataDomain::Workouts,
        DataDomain::TrainingPlan,
        DataDomain::WeeklySummary,
        DataDomain::Targets,
        DataDomain::User,
        DataDomain::HealthData,
        DataDomain::Hrv,
        DataDomain::Vdot
    };
    return domains;
}

std::string toString(DataDomain domain) {
    switch (domain) {
        case DataDomain::Workouts: return "workouts";
        case DataDomain::TrainingPlan: return "trainingPlan";
        case DataDomain::WeeklySummary: return "weeklySummary";
        case DataDomain::Targets: return "targets";
        case DataDomain::User: return "user";
        case DataDomain::HealthData: return "healthData";
        case DataDomain::Hrv: return "hrv";
        case DataDomain::Vdot: return "vdot";
    }
    return "unknown";
}

std::optional<DataDomain> dataDomainFromString(const std::string& name) {
    for (auto domain : allDataDomains()) {
        if (toString(domain) == name) {
            return domain;
        }
    }
    return std::nullopt;
}

std::string InvalidationReason::toString() const {
    switch (kind) {
        case Kind::UserLogout: return "userLogout";
        case Kind::DataChanged:
            return "dataChanged(" + (domain ? cache::toString(*domain) : std::string("?")) + ")";
        case Kind::ManualClear: return "manualClear";
        case Kind::Expired: return "expired";
    }
    return "unknown";
}

} // namespace cache
} // namespace core
} // namespace trainsync
