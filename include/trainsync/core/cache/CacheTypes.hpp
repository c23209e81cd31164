#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace trainsync {
namespace core {
namespace cache {

using CacheIdentity = std::string;

// Идентификаторы кэшей
namespace identities {
constexpr const char* kTrainingPlan = "training_plan";
constexpr const char* kWeeklySummary = "weekly_summary";
constexpr const char* kWorkouts = "workouts_v2";
constexpr const char* kWorkoutUpload = "workout_upload";
constexpr const char* kTargets = "targets";
constexpr const char* kHealthData = "health_data";
constexpr const char* kHrv = "hrv";
constexpr const char* kVdot = "vdot";
} // namespace identities

// DataDomain - семантический тип данных, изменение которого инвалидирует кэши
enum class DataDomain {
    Workouts,
    TrainingPlan,
    WeeklySummary,
    Targets,
    User,
    HealthData,
    Hrv,
    Vdot
};

const std::vector<DataDomain>& allDataDomains();
std::string toString(DataDomain domain);
std::optional<DataDomain> dataDomainFromString(const std::string& name);

// InvalidationReason - причина инвалидации
struct InvalidationReason {
    enum class Kind {
        UserLogout,
        DataChanged,
        ManualClear,
        Expired
    };

    Kind kind = Kind::ManualClear;
    std::optional<DataDomain> domain; // Только для DataChanged

    static InvalidationReason userLogout() { return {Kind::UserLogout, std::nullopt}; }
    static InvalidationReason dataChanged(DataDomain d) { return {Kind::DataChanged, d}; }
    static InvalidationReason manualClear() { return {Kind::ManualClear, std::nullopt}; }
    static InvalidationReason expired() { return {Kind::Expired, std::nullopt}; }

    std::string toString() const;
};

// CacheStatus - агрегат для диагностики (без побочных эффектов)
struct CacheStatus {
    size_t totalCaches = 0;     // Зарегистрировано кэшей
    size_t totalSizeBytes = 0;  // Суммарный размер (байт)
    size_t expiredCount = 0;    // Просроченных
    std::vector<CacheIdentity> identities; // Идентификаторы
    nlohmann::json toJson() const {
        return {
            {"totalCaches", totalCaches},
            {"totalSizeBytes", totalSizeBytes},
            {"expiredCount", expiredCount},
            {"identities", identities}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace trainsync
