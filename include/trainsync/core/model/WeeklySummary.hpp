#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace trainsync {
namespace core {
namespace model {

// WeeklySummary - итоги недели
struct WeeklySummary {
    int weekNumber = 0;
    double distanceKm = 0.0;
    double completionPercentage = 0.0; // 0..100
    std::string summary;

    nlohmann::json toJson() const {
        return {
            {"week_number", weekNumber},
            {"distance_km", distanceKm},
            {"completion_percentage", completionPercentage},
            {"summary", summary}
        };
    }
    static WeeklySummary fromJson(const nlohmann::json& j) {
        WeeklySummary s;
        s.weekNumber = j.at("week_number").get<int>();
        s.distanceKm = j.at("distance_km").get<double>();
        s.completionPercentage = j.at("completion_percentage").get<double>();
        s.summary = j.value("summary", std::string());
        return s;
    }
    bool operator==(const WeeklySummary& other) const {
        return weekNumber == other.weekNumber && distanceKm == other.distanceKm &&
               completionPercentage == other.completionPercentage && summary == other.summary;
    }
};

} // namespace model
} // namespace core
} // namespace trainsync
