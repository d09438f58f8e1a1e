#include "runtime/plan_runner.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace trustgate::runtime {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;
using protocol::InvocationResult;
using protocol::PlanResult;
using protocol::PlanStatus;
using protocol::PlanStep;
using protocol::StepDisposition;
using protocol::ToolCall;

namespace {

void reject(PlanStep& step, const GateError& err) {
    step.disposition = StepDisposition::Rejected;
    step.success = false;
    step.output = "[" + err.code + "] " + err.message;
}

}  // namespace

core::errors::Result<std::vector<ToolCall>> load_plan(const std::filesystem::path& plan_file) {
    std::ifstream in(plan_file);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input, "Plan file not found: " + plan_file.string(),
                         "plan_file_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json root = json::parse(buffer.str(), nullptr, false);
    if (root.is_discarded() || !root.is_array()) {
        return GateError{ErrorCategory::Input,
                         "Plan file must contain a JSON array of tool calls.",
                         "invalid_plan_format"};
    }

    std::vector<ToolCall> calls;
    int next_call_id = 1;
    for (const auto& entry : root) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return GateError{ErrorCategory::Input,
                             "Each tool call needs a string 'name'.", "invalid_plan_format"};
        }

        ToolCall call;
        call.name = entry["name"].get<std::string>();
        if (entry.contains("id") && entry["id"].is_string()) {
            call.id = entry["id"].get<std::string>();
        } else {
            call.id = "call-" + std::to_string(next_call_id);
        }
        ++next_call_id;

        if (!entry.contains("arguments") || entry["arguments"].is_null()) {
            call.arguments = "{}";
        } else if (entry["arguments"].is_string()) {
            call.arguments = entry["arguments"].get<std::string>();
        } else {
            call.arguments = entry["arguments"].dump();
        }
        calls.push_back(std::move(call));
    }
    return calls;
}

PlanRunner::PlanRunner(const tools::ToolRegistry& registry, session::ToolInvocationGate& gate,
                       ConfirmationPrompter& prompter, ToolExecutor& executor)
    : registry_(registry), gate_(gate), prompter_(prompter), executor_(executor) {}

core::errors::Result<PlanResult> PlanRunner::run(
    const std::string& session_id, const std::vector<ToolCall>& calls,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    if (calls.empty()) {
        return GateError{ErrorCategory::Input, "Plan contains no tool calls.", "empty_plan"};
    }
    if (!cancel_token) {
        cancel_token = std::make_shared<std::atomic_bool>(false);
    }

    PlanResult result;
    result.session_id = session_id;
    result.status = PlanStatus::Completed;

    std::size_t executed = 0;
    std::size_t cancelled = 0;
    std::size_t rejected = 0;
    for (const auto& call : calls) {
        PlanStep step = run_call(call, cancel_token);
        if (step.executed) {
            ++executed;
        }
        if (step.disposition == StepDisposition::Cancelled) {
            ++cancelled;
        }
        if (step.disposition == StepDisposition::Rejected || (step.executed && !step.success)) {
            ++rejected;
            result.status = PlanStatus::Failed;
        }
        result.steps.push_back(std::move(step));
    }

    result.summary = "Processed " + std::to_string(calls.size()) + " tool calls: " +
                     std::to_string(executed) + " executed, " + std::to_string(cancelled) +
                     " cancelled, " + std::to_string(rejected) + " failed.";
    return result;
}

PlanStep PlanRunner::run_call(const ToolCall& call,
                              const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    PlanStep step;
    step.call_id = call.id;
    step.tool_name = call.name;

    if (cancel_token && cancel_token->load()) {
        step.disposition = StepDisposition::Cancelled;
        step.output = "Plan cancelled before this call.";
        return step;
    }

    const protocol::ToolDescriptor* tool = registry_.find(call.name);
    if (tool == nullptr) {
        reject(step, GateError{ErrorCategory::Input, "Unknown tool: " + call.name,
                               "unknown_tool"});
        return step;
    }

    const json params = json::parse(call.arguments, nullptr, false);
    if (params.is_discarded()) {
        reject(step, GateError{ErrorCategory::Validation,
                               "Tool call arguments are not valid JSON.", "invalid_params"});
        return step;
    }

    // Per-call token: cancelling one invocation leaves the rest of the plan alone
    auto call_token = std::make_shared<std::atomic_bool>(false);
    auto evaluated = gate_.evaluate(*tool, params, call_token);
    if (core::errors::is_error(evaluated)) {
        reject(step, core::errors::get_error(evaluated));
        return step;
    }
    const auto& decision = core::errors::get_value(evaluated);

    if (const auto* auto_proceed = std::get_if<session::AutoProceed>(&decision)) {
        step.invocation_id = auto_proceed->invocation_id;
        step.disposition = StepDisposition::AutoApproved;
        execute_step(*tool, params, step);
        return step;
    }

    const auto& request = std::get<std::shared_ptr<session::ConfirmationRequest>>(decision);
    step.invocation_id = request->invocation_id();

    const protocol::ConfirmationOutcome outcome = prompter_.prompt(*request);
    if (cancel_token && cancel_token->load()) {
        auto cancelled = gate_.cancel(request->invocation_id());
        if (core::errors::is_error(cancelled)) {
            LOG_WARN("PlanRunner: " + step.call_id + " not cancelled: " +
                     core::errors::get_error(cancelled).message);
        }
    }
    if (request->is_resolved()) {
        step.disposition = StepDisposition::Cancelled;
        step.output = "Cancelled while awaiting confirmation.";
        return step;
    }

    auto resolved = gate_.resolve(*request, outcome);
    if (core::errors::is_error(resolved)) {
        reject(step, core::errors::get_error(resolved));
        return step;
    }

    if (core::errors::get_value(resolved) == InvocationResult::Cancelled) {
        step.disposition = StepDisposition::Cancelled;
        step.output = "Cancelled by user.";
        return step;
    }

    step.disposition = StepDisposition::Confirmed;
    execute_step(*tool, params, step);
    return step;
}

void PlanRunner::execute_step(const protocol::ToolDescriptor& tool, const json& params,
                              PlanStep& step) const {
    auto executed = executor_.execute(tool, params);
    step.executed = true;
    if (core::errors::is_error(executed)) {
        const auto& err = core::errors::get_error(executed);
        step.success = false;
        step.output = "[" + err.code + "] " + err.message;
        LOG_WARN("PlanRunner: " + step.call_id + " execution failed: " + err.message);
        return;
    }

    const auto& tool_result = core::errors::get_value(executed);
    step.success = tool_result.success;
    step.output = tool_result.success ? tool_result.output : tool_result.error_message;
}

}  // namespace trustgate::runtime
