#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/collaborators.hpp"
#include "session/tool_invocation_gate.hpp"
#include "tools/tool_registry.hpp"

namespace trustgate::runtime {

// Reads a JSON array of {"id", "name", "arguments"} tool calls.
core::errors::Result<std::vector<protocol::ToolCall>> load_plan(
    const std::filesystem::path& plan_file);

class PlanRunner {
public:
    PlanRunner(const tools::ToolRegistry& registry, session::ToolInvocationGate& gate,
               ConfirmationPrompter& prompter, ToolExecutor& executor);

    core::errors::Result<protocol::PlanResult> run(
        const std::string& session_id, const std::vector<protocol::ToolCall>& calls,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

private:
    protocol::PlanStep run_call(const protocol::ToolCall& call,
                                const std::shared_ptr<std::atomic_bool>& cancel_token) const;
    void execute_step(const protocol::ToolDescriptor& tool, const nlohmann::json& params,
                      protocol::PlanStep& step) const;

    const tools::ToolRegistry& registry_;
    session::ToolInvocationGate& gate_;
    ConfirmationPrompter& prompter_;
    ToolExecutor& executor_;
};

}  // namespace trustgate::runtime
