#include "trainsync/core/model/TrainingPlanOverview.hpp"
#include <stdexcept>

namespace trainsync {
namespace core {
namespace model {

nlohmann::json TrainingStage::toJson() const {
    return {
        {"stage_id", stageId},
        {"stage_name", stageName},
        {"week_start", weekStart},
        {"week_end", weekEnd ? nlohmann::json(*weekEnd) : nlohmann::json(nullptr)}
    };
}

TrainingStage TrainingStage::fromJson(const nlohmann::json& j) {
    TrainingStage stage;
    stage.stageId = j.at("stage_id").get<std::string>();
    stage.stageName = j.at("stage_name").get<std::string>();
    stage.weekStart = j.at("week_start").get<int>();
    if (j.contains("week_end") && !j.at("week_end").is_null()) {
        stage.weekEnd = j.at("week_end").get<int>();
    }
    return stage;
}

const TrainingStage* TrainingPlanOverview::stageForWeek(int week) const {
    for (const auto& stage : stages) {
        if (stage.containsWeek(week)) {
            return &stage;
        }
    }
    return nullptr;
}

nlohmann::json TrainingPlanOverview::toJson() const {
    nlohmann::json stageList = nlohmann::json::array();
    for (const auto& stage : stages) {
        stageList.push_back(stage.toJson());
    }
    return {
        {"id", id},
        {"training_plan_name", trainingPlanName},
        {"total_weeks", totalWeeks},
        {"created_at", createdAtEpoch},
        {"training_stage_discription", stageList}
    };
}

TrainingPlanOverview TrainingPlanOverview::fromJson(const nlohmann::json& j) {
    TrainingPlanOverview overview;
    overview.id = j.at("id").get<std::string>();
    overview.trainingPlanName = j.at("training_plan_name").get<std::string>();
    overview.totalWeeks = j.at("total_weeks").get<int>();
    // Только целые секунды: дробные метки считаются повреждением
    const auto& created = j.at("created_at");
    if (!created.is_number_integer()) {
        throw std::invalid_argument("created_at must be integral epoch seconds");
    }
    overview.createdAtEpoch = created.get<int64_t>();
    for (const auto& stage : j.at("training_stage_discription")) {
        overview.stages.push_back(TrainingStage::fromJson(stage));
    }
    if (overview.id.empty()) {
        throw std::invalid_argument("overview id is empty");
    }
    return overview;
}

} // namespace model
} // namespace core
} // namespace trainsync
