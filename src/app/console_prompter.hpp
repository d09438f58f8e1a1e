#pragma once

#include <istream>
#include <ostream>
#include "protocol/confirmation_contract.hpp"
#include "runtime/collaborators.hpp"
#include "session/confirmation_request.hpp"

namespace trustgate::app {

// Line-based terminal prompt. Unreadable input or EOF counts as Cancel.
class ConsolePrompter final : public runtime::ConfirmationPrompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out);

    protocol::ConfirmationOutcome prompt(const session::ConfirmationRequest& request) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// Stand-in execution collaborator for the CLI: reports what would run.
class ReportingExecutor final : public runtime::ToolExecutor {
public:
    explicit ReportingExecutor(std::ostream& out);

    core::errors::Result<protocol::ToolResult> execute(const protocol::ToolDescriptor& tool,
                                                       const nlohmann::json& params) override;

private:
    std::ostream& out_;
};

}  // namespace trustgate::app
