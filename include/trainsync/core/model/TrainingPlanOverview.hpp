#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace trainsync {
namespace core {
namespace model {

// TrainingStage - этап плана (база, развитие, подводка...)
struct TrainingStage {
    std::string stageId;
    std::string stageName;
    int weekStart = 1;
    std::optional<int> weekEnd; // Нет = до конца плана

    bool containsWeek(int week) const {
        return week >= weekStart && (!weekEnd || week <= *weekEnd);
    }
    nlohmann::json toJson() const;
    static TrainingStage fromJson(const nlohmann::json& j);
    bool operator==(const TrainingStage& other) const {
        return stageId == other.stageId && stageName == other.stageName &&
               weekStart == other.weekStart && weekEnd == other.weekEnd;
    }
};

// TrainingPlanOverview - обзор всего плана
struct TrainingPlanOverview {
    std::string id;
    std::string trainingPlanName;
    int totalWeeks = 0;
    int64_t createdAtEpoch = 0;          // Начало плана (epoch sec)
    std::vector<TrainingStage> stages;

    const TrainingStage* stageForWeek(int week) const; // nullptr, если этапа нет
    nlohmann::json toJson() const;
    static TrainingPlanOverview fromJson(const nlohmann::json& j);
    bool operator==(const TrainingPlanOverview& other) const {
        return id == other.id && trainingPlanName == other.trainingPlanName &&
               totalWeeks == other.totalWeeks && createdAtEpoch == other.createdAtEpoch &&
               stages == other.stages;
    }
};

} // namespace model
} // namespace core
} // namespace trainsync
