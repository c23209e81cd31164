#include "trainsync/core/plan/PlanSyncState.hpp"

namespace trainsync {
namespace core {
namespace plan {

std::string toString(PlanStatus status) {
    switch (status) {
    case PlanStatus::Loading: return "loading";
    case PlanStatus::NoPlan: return "noPlan";
    case PlanStatus::Ready: return "ready";
    case PlanStatus::Completed: return "completed";
    case PlanStatus::Error: return "error";
    }
    return "unknown";
}

nlohmann::json PlanSyncState::toJson() const {
    nlohmann::json j = {{"status", toString(status)}};
    if (plan) {
        j["plan"] = plan->toJson();
    }
    if (error) {
        j["error"] = error->toJson();
    }
    return j;
}

PlanSyncState deriveState(const PlanSyncFacts& facts) {
    if (facts.totalWeeks > 0 && facts.selectedWeek > facts.totalWeeks) {
        return PlanSyncState::completed();
    }
    if (facts.plan && facts.plan->weekOfPlan == facts.selectedWeek) {
        return PlanSyncState::ready(*facts.plan);
    }
    switch (facts.phase) {
    case FetchPhase::Failed:
        return PlanSyncState::failed(facts.error.value_or(ErrorInfo{}));
    case FetchPhase::Loading:
        return PlanSyncState::loading();
    case FetchPhase::NotFound:
    case FetchPhase::Idle:
        break;
    }
    return PlanSyncState::noPlan();
}

} // namespace plan
} // namespace core
} // namespace trainsync
