#pragma once

#include <string>
#include <variant>

namespace trustgate::protocol {

// Decision made once per invocation by the prompting collaborator.
enum class ConfirmationOutcome {
    ProceedOnce,
    ProceedAlways,
    ProceedAlwaysTool,
    ProceedAlwaysServer,
    Cancel
};

// Per-invocation trust state.
// Unchecked -> {AutoProceed | AwaitingConfirmation} -> {Proceeded | Cancelled}
enum class InvocationState {
    Unchecked,
    AutoProceed,
    AwaitingConfirmation,
    Proceeded,
    Cancelled
};

enum class InvocationResult {
    Proceeded,
    Cancelled
};

struct ShellConfirmationDetails {
    std::string command;
    std::string root_command;
    std::string description;
};

struct BridgedConfirmationDetails {
    std::string server_id;
    std::string tool_id;
    std::string tool_name;
    std::string arguments_json;
};

using ConfirmationDetails =
    std::variant<ShellConfirmationDetails, BridgedConfirmationDetails>;

inline std::string to_string(const ConfirmationOutcome outcome) {
    switch (outcome) {
        case ConfirmationOutcome::ProceedOnce:
            return "proceed_once";
        case ConfirmationOutcome::ProceedAlways:
            return "proceed_always";
        case ConfirmationOutcome::ProceedAlwaysTool:
            return "proceed_always_tool";
        case ConfirmationOutcome::ProceedAlwaysServer:
            return "proceed_always_server";
        case ConfirmationOutcome::Cancel:
            return "cancel";
        default:
            return "unknown";
    }
}

inline std::string to_string(const InvocationState state) {
    switch (state) {
        case InvocationState::Unchecked:
            return "unchecked";
        case InvocationState::AutoProceed:
            return "auto_proceed";
        case InvocationState::AwaitingConfirmation:
            return "awaiting_confirmation";
        case InvocationState::Proceeded:
            return "proceeded";
        case InvocationState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline std::string to_string(const InvocationResult result) {
    switch (result) {
        case InvocationResult::Proceeded:
            return "proceeded";
        case InvocationResult::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

}  // namespace trustgate::protocol
