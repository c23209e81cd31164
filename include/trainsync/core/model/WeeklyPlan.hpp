#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace trainsync {
namespace core {
namespace model {

// TrainingDay - тренировочный день недельного плана
struct TrainingDay {
    int dayIndex = 0;                 // 1..7
    std::string dayTarget;            // Цель дня
    std::string trainingType;         // easy_run, interval, rest, ...
    std::optional<std::string> reason;
    std::optional<std::string> tips;

    bool isRestDay() const { return trainingType == "rest"; }
    nlohmann::json toJson() const;
    static TrainingDay fromJson(const nlohmann::json& j);
    bool operator==(const TrainingDay& other) const;
};

// WeeklyPlan - недельный план (значение, принадлежит кэшу)
struct WeeklyPlan {
    std::string id;                   // "<overviewId>_<week>"
    std::string purpose;
    int weekOfPlan = 0;
    int totalWeeks = 0;
    double totalDistanceKm = 0.0;
    std::vector<std::string> designReason;
    std::vector<TrainingDay> days;

    nlohmann::json toJson() const;
    static WeeklyPlan fromJson(const nlohmann::json& j); // Строгий разбор: ошибка -> исключение
    bool operator==(const WeeklyPlan& other) const;
    bool operator!=(const WeeklyPlan& other) const { return !(*this == other); }
};

// Составной идентификатор плана: "<overviewId>_<week>"
std::string makeWeeklyPlanId(const std::string& overviewId, int week);

} // namespace model
} // namespace core
} // namespace trainsync
