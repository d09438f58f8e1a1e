#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/confirmation_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "session/confirmation_request.hpp"

namespace trustgate::runtime {

// UI side: renders the request and maps the user's choice 1:1 to an outcome.
class ConfirmationPrompter {
public:
    virtual ~ConfirmationPrompter() = default;
    virtual protocol::ConfirmationOutcome prompt(const session::ConfirmationRequest& request) = 0;
};

// Shell process runner or remote tool-bridge caller. Only invoked after the
// gate has let the invocation proceed.
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;
    virtual core::errors::Result<protocol::ToolResult> execute(
        const protocol::ToolDescriptor& tool, const nlohmann::json& params) = 0;
};

}  // namespace trustgate::runtime
