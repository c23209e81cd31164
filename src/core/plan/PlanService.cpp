#include "trainsync/core/plan/PlanService.hpp"

namespace trainsync {
namespace core {
namespace plan {

std::string toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "notFound";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Decode: return "decode";
    case ErrorKind::Canceled: return "canceled";
    case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

ServiceError ServiceError::fromHttpStatus(int status, const std::string& message) {
    const std::string text = message.empty() ? "HTTP " + std::to_string(status) : message;
    if (status == 404) {
        return ServiceError(ErrorKind::NotFound, text);
    }
    if ((status >= 500 && status <= 599) || status == 408 || status == 429) {
        return ServiceError(ErrorKind::Transport, text);
    }
    return ServiceError(ErrorKind::Unknown, text);
}

} // namespace plan
} // namespace core
} // namespace trainsync
