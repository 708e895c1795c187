#pragma once

#include <stdexcept>
#include <string>

namespace kvplane {

enum class RouterErrorCode : int {
    kOk = 0,
    kNoEligibleWorker = 1,
    kSchedulerUnavailable = 2,
    kCancelled = 3,
    kInvalidRequest = 4,
};

inline const char* to_string(RouterErrorCode code) {
    switch (code) {
        case RouterErrorCode::kOk:
            return "OK";
        case RouterErrorCode::kNoEligibleWorker:
            return "NO_ELIGIBLE_WORKER";
        case RouterErrorCode::kSchedulerUnavailable:
            return "SCHEDULER_UNAVAILABLE";
        case RouterErrorCode::kCancelled:
            return "CANCELLED";
        case RouterErrorCode::kInvalidRequest:
            return "INVALID_REQUEST";
    }
    return "UNKNOWN";
}

/// Raised on the routing path. Callers fall back to a simple policy on
/// kNoEligibleWorker and kSchedulerUnavailable rather than stalling.
class RouterError : public std::runtime_error {
public:
    RouterError(RouterErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code) {}

    RouterErrorCode code() const { return code_; }

private:
    RouterErrorCode code_;
};

}  // namespace kvplane
