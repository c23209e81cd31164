#include "trainsync/core/model/WorkoutUpload.hpp"
#include <stdexcept>

namespace trainsync {
namespace core {
namespace model {

std::string WorkoutKey::stableId() const {
    return std::to_string(startEpoch) + "_" + std::to_string(endEpoch) + "_" + activityType;
}

nlohmann::json WorkoutUploadLedger::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [id, uploadedAt] : uploads) {
        j[id] = uploadedAt;
    }
    return {{"uploads", j}};
}

WorkoutUploadLedger WorkoutUploadLedger::fromJson(const nlohmann::json& j) {
    WorkoutUploadLedger ledger;
    for (const auto& [id, value] : j.at("uploads").items()) {
        if (!value.is_number_integer()) {
            throw std::invalid_argument("upload time for '" + id + "' is not integral");
        }
        ledger.uploads[id] = value.get<int64_t>();
    }
    return ledger;
}

} // namespace model
} // namespace core
} // namespace trainsync
