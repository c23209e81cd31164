#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace trainsync {
namespace core {
namespace model {

// WorkoutKey - стабильный идентификатор тренировки из целых epoch-секунд
struct WorkoutKey {
    int64_t startEpoch = 0;
    int64_t endEpoch = 0;
    std::string activityType; // running, walking, ...

    std::string stableId() const; // "<start>_<end>_<type>"
};

// WorkoutUploadLedger - stableId -> время загрузки (epoch sec)
struct WorkoutUploadLedger {
    std::map<std::string, int64_t> uploads;

    nlohmann::json toJson() const;
    static WorkoutUploadLedger fromJson(const nlohmann::json& j);
};

} // namespace model
} // namespace core
} // namespace trainsync
