#include "policy/trust_evaluator.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "policy/command_root.hpp"
#include "tools/bridged_params.hpp"
#include "tools/shell_params.hpp"

namespace trustgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::InvocationState;
using protocol::ToolDescriptor;
using protocol::ToolKind;

namespace {

constexpr const char* kShellTitle = "Confirm Shell Command";
constexpr const char* kBridgedTitle = "Confirm Bridged Tool Execution";

TrustDecision auto_proceed(std::string reason) {
    TrustDecision decision;
    decision.state = InvocationState::AutoProceed;
    decision.reason = std::move(reason);
    return decision;
}

}  // namespace

TrustEvaluator::TrustEvaluator(const AllowlistStore& store) : store_(store) {}

core::errors::Result<TrustDecision> TrustEvaluator::decide(const ToolDescriptor& tool,
                                                           const nlohmann::json& params) const {
    if (tool.always_trusted) {
        LOG_DEBUG("TrustEvaluator: " + tool.name + " is always trusted");
        return auto_proceed("always_trusted");
    }

    switch (tool.kind) {
        case ToolKind::Shell:
            return decide_shell(tool, params);
        case ToolKind::Bridged:
            return decide_bridged(tool, params);
        default:
            return GateError{ErrorCategory::Internal,
                             "Unknown tool kind for tool: " + tool.name,
                             "unknown_tool_kind"};
    }
}

core::errors::Result<TrustDecision> TrustEvaluator::decide_shell(
    const ToolDescriptor& tool, const nlohmann::json& params) const {
    auto parsed = tools::parse_shell_params(params);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& shell_params = core::errors::get_value(parsed);

    const std::string root = extract_command_root(shell_params.command);
    if (root.empty()) {
        return GateError{ErrorCategory::Validation,
                         "Could not determine the command root of: " + shell_params.command,
                         "ambiguous_command_root",
                         "Start the command with the program to run."};
    }

    const AllowlistKey key = shell_root_key(root);
    if (store_.is_allowed(key)) {
        LOG_DEBUG("TrustEvaluator: shell root '" + root + "' is allowlisted for " + tool.name);
        return auto_proceed("allowlisted_root");
    }

    PendingConfirmation pending;
    pending.kind = ToolKind::Shell;
    pending.title = kShellTitle;
    pending.details = protocol::ShellConfirmationDetails{
        shell_params.command, root, tools::describe_shell_invocation(shell_params)};
    pending.fine_key = key;

    TrustDecision decision;
    decision.state = InvocationState::AwaitingConfirmation;
    decision.reason = "not_allowlisted";
    decision.pending = std::move(pending);
    return decision;
}

core::errors::Result<TrustDecision> TrustEvaluator::decide_bridged(
    const ToolDescriptor& tool, const nlohmann::json& params) const {
    if (tool.server_id.empty() || tool.server_tool_id.empty()) {
        return GateError{ErrorCategory::Validation,
                         "Bridged tool is missing its server or tool identity: " + tool.name,
                         "invalid_tool"};
    }
    if (!is_valid_server_id(tool.server_id)) {
        return GateError{ErrorCategory::Validation,
                         "Bridged server id must not contain '.': " + tool.server_id,
                         "invalid_tool"};
    }

    auto normalized = tools::normalize_bridged_params(params);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }

    const AllowlistKey server_key = bridged_server_key(tool.server_id);
    if (store_.is_allowed(server_key)) {
        return auto_proceed("allowlisted_server");
    }

    const AllowlistKey tool_key = bridged_tool_key(tool.server_id, tool.server_tool_id);
    if (store_.is_allowed(tool_key)) {
        return auto_proceed("allowlisted_tool");
    }

    PendingConfirmation pending;
    pending.kind = ToolKind::Bridged;
    pending.title = kBridgedTitle;
    pending.details = protocol::BridgedConfirmationDetails{
        tool.server_id, tool.server_tool_id, tool.name,
        core::errors::get_value(normalized).dump()};
    pending.fine_key = tool_key;
    pending.coarse_key = server_key;

    TrustDecision decision;
    decision.state = InvocationState::AwaitingConfirmation;
    decision.reason = "not_allowlisted";
    decision.pending = std::move(pending);
    return decision;
}

}  // namespace trustgate::policy
