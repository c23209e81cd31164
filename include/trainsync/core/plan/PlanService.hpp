#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "trainsync/core/model/TrainingPlanOverview.hpp"
#include "trainsync/core/model/WeeklyPlan.hpp"
#include "trainsync/core/task/CancellationToken.hpp"

namespace trainsync {
namespace core {
namespace plan {

// Шаги синхронизации плана (поле ErrorInfo::step)
namespace steps {
constexpr const char* kFetchOverview = "fetch_overview";
constexpr const char* kFetchPlan = "fetch_plan";
constexpr const char* kCreatePlan = "create_plan";
} // namespace steps

enum class ErrorKind {
    NotFound,
    Transport,
    Decode,
    Canceled,
    Unknown
};

std::string toString(ErrorKind kind);

// ErrorInfo - описание ошибки для опубликованного состояния
struct ErrorInfo {
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;
    std::string step; // Шаг, на котором произошла ошибка

    nlohmann::json toJson() const {
        return {{"kind", toString(kind)}, {"message", message}, {"step", step}};
    }
    bool operator==(const ErrorInfo& other) const {
        return kind == other.kind && message == other.message && step == other.step;
    }
};

// ServiceError - ошибка PlanService
class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
    bool isNotFound() const { return kind_ == ErrorKind::NotFound; }

    // 404 -> NotFound; 5xx, 408, 429 -> Transport; прочее -> Unknown
    static ServiceError fromHttpStatus(int status, const std::string& message = {});
private:
    ErrorKind kind_;
};

// PlanService - удаленный сервис планов. Реализация обязана проверять token
// и может бросать ServiceError или OperationCanceled.
class PlanService {
public:
    virtual ~PlanService() = default;
    virtual model::TrainingPlanOverview fetchOverview(const task::CancellationToken& token) = 0;
    virtual model::WeeklyPlan fetchPlan(const std::string& planId, const task::CancellationToken& token) = 0;
    virtual void createPlan(int targetWeek, const task::CancellationToken& token) = 0;
};

} // namespace plan
} // namespace core
} // namespace trainsync
