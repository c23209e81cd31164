#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "trainsync/core/model/WeeklyPlan.hpp"
#include "trainsync/core/plan/PlanService.hpp"

namespace trainsync {
namespace core {
namespace plan {

enum class PlanStatus {
    Loading,
    NoPlan,
    Ready,
    Completed,
    Error
};

std::string toString(PlanStatus status);

// PlanSyncState - опубликованное состояние недельного плана.
// plan заполнен только для Ready, error - только для Error.
struct PlanSyncState {
    PlanStatus status = PlanStatus::NoPlan;
    std::optional<model::WeeklyPlan> plan;
    std::optional<ErrorInfo> error;

    static PlanSyncState loading() { return {PlanStatus::Loading, std::nullopt, std::nullopt}; }
    static PlanSyncState noPlan() { return {PlanStatus::NoPlan, std::nullopt, std::nullopt}; }
    static PlanSyncState ready(model::WeeklyPlan plan) { return {PlanStatus::Ready, std::move(plan), std::nullopt}; }
    static PlanSyncState completed() { return {PlanStatus::Completed, std::nullopt, std::nullopt}; }
    static PlanSyncState failed(ErrorInfo error) { return {PlanStatus::Error, std::nullopt, std::move(error)}; }

    bool operator==(const PlanSyncState& other) const {
        return status == other.status && plan == other.plan && error == other.error;
    }
    bool operator!=(const PlanSyncState& other) const { return !(*this == other); }
    nlohmann::json toJson() const;
};

// Фаза последней загрузки выбранной недели
enum class FetchPhase {
    Idle,
    Loading,
    NotFound,
    Failed
};

// PlanSyncFacts - входные данные, из которых выводится состояние
struct PlanSyncFacts {
    std::optional<model::WeeklyPlan> plan; // Текущий план в памяти
    FetchPhase phase = FetchPhase::Idle;
    std::optional<ErrorInfo> error;        // Для FetchPhase::Failed
    int selectedWeek = 1;
    int totalWeeks = 0;                    // 0 = неизвестно
};

// Чистая функция: порядок правил
// completed > ready(план выбранной недели) > error > loading > noPlan
PlanSyncState deriveState(const PlanSyncFacts& facts);

} // namespace plan
} // namespace core
} // namespace trainsync
