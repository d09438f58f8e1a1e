#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace trustgate::protocol {

enum class PlanStatus {
    Completed,
    Failed
};

enum class StepDisposition {
    AutoApproved,
    Confirmed,
    Cancelled,
    Rejected
};

struct PlanStep {
    std::string call_id;
    std::string tool_name;
    std::string invocation_id;
    StepDisposition disposition = StepDisposition::Rejected;
    bool executed = false;
    bool success = false;
    std::string output;
};

struct PlanResult {
    std::string session_id;
    PlanStatus status = PlanStatus::Completed;
    std::vector<PlanStep> steps;
    std::string summary;
};

inline std::string to_string(const PlanStatus status) {
    switch (status) {
        case PlanStatus::Completed:
            return "completed";
        case PlanStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::string to_string(const StepDisposition disposition) {
    switch (disposition) {
        case StepDisposition::AutoApproved:
            return "auto_approved";
        case StepDisposition::Confirmed:
            return "confirmed";
        case StepDisposition::Cancelled:
            return "cancelled";
        case StepDisposition::Rejected:
            return "rejected";
        default:
            return "unknown";
    }
}

}  // namespace trustgate::protocol
