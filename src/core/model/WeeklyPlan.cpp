#include "trainsync/core/model/WeeklyPlan.hpp"
#include <stdexcept>

namespace trainsync {
namespace core {
namespace model {

namespace {

std::optional<std::string> optionalString(const nlohmann::json& j, const char* field) {
    if (!j.contains(field) || j.at(field).is_null()) {
        return std::nullopt;
    }
    return j.at(field).get<std::string>();
}

} // namespace

nlohmann::json TrainingDay::toJson() const {
    nlohmann::json j = {
        {"day_index", dayIndex},
        {"day_target", dayTarget},
        {"training_type", trainingType}
    };
    j["reason"] = reason ? nlohmann::json(*reason) : nlohmann::json(nullptr);
    j["tips"] = tips ? nlohmann::json(*tips) : nlohmann::json(nullptr);
    return j;
}

TrainingDay TrainingDay::fromJson(const nlohmann::json& j) {
    TrainingDay day;
    // day_index приходит строкой или числом
    const auto& index = j.at("day_index");
    if (index.is_string()) {
        day.dayIndex = std::stoi(index.get<std::string>());
    } else {
        day.dayIndex = index.get<int>();
    }
    day.dayTarget = j.at("day_target").get<std::string>();
    day.trainingType = j.at("training_type").get<std::string>();
    day.reason = optionalString(j, "reason");
    day.tips = optionalString(j, "tips");
    return day;
}

bool TrainingDay::operator==(const TrainingDay& other) const {
    return dayIndex == other.dayIndex && dayTarget == other.dayTarget &&
           trainingType == other.trainingType && reason == other.reason && tips == other.tips;
}

nlohmann::json WeeklyPlan::toJson() const {
    nlohmann::json dayList = nlohmann::json::array();
    for (const auto& day : days) {
        dayList.push_back(day.toJson());
    }
    return {
        {"id", id},
        {"purpose", purpose},
        {"week_of_plan", weekOfPlan},
        {"total_weeks", totalWeeks},
        {"total_distance_km", totalDistanceKm},
        {"design_reason", designReason},
        {"days", dayList}
    };
}

WeeklyPlan WeeklyPlan::fromJson(const nlohmann::json& j) {
    WeeklyPlan plan;
    plan.id = j.at("id").get<std::string>();
    plan.purpose = j.at("purpose").get<std::string>();
    plan.weekOfPlan = j.at("week_of_plan").get<int>();
    plan.totalWeeks = j.at("total_weeks").get<int>();
    plan.totalDistanceKm = j.value("total_distance_km", 0.0);
    if (j.contains("design_reason") && !j.at("design_reason").is_null()) {
        plan.designReason = j.at("design_reason").get<std::vector<std::string>>();
    }
    for (const auto& day : j.at("days")) {
        plan.days.push_back(TrainingDay::fromJson(day));
    }
    if (plan.weekOfPlan <= 0) {
        throw std::invalid_argument("week_of_plan must be positive");
    }
    return plan;
}

bool WeeklyPlan::operator==(const WeeklyPlan& other) const {
    return id == other.id && purpose == other.purpose && weekOfPlan == other.weekOfPlan &&
           totalWeeks == other.totalWeeks && totalDistanceKm == other.totalDistanceKm &&
           designReason == other.designReason && days == other.days;
}

std::string makeWeeklyPlanId(const std::string& overviewId, int week) {
    return overviewId + "_" + std::to_string(week);
}

} // namespace model
} // namespace core
} // namespace trainsync
