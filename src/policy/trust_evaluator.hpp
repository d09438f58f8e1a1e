#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "policy/allowlist_store.hpp"
#include "protocol/confirmation_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace trustgate::policy {

// Everything the resolution step needs, computed once during evaluation.
struct PendingConfirmation {
    protocol::ToolKind kind = protocol::ToolKind::Shell;
    std::string title;
    protocol::ConfirmationDetails details;
    AllowlistKey fine_key;                   // command root, or server.tool
    std::optional<AllowlistKey> coarse_key;  // whole server, bridged only
};

struct TrustDecision {
    protocol::InvocationState state = protocol::InvocationState::Unchecked;
    std::string reason;
    std::optional<PendingConfirmation> pending;  // set iff AwaitingConfirmation
};

class TrustEvaluator {
public:
    explicit TrustEvaluator(const AllowlistStore& store);

    // Rules, first match wins:
    //   1. always_trusted tool              -> AutoProceed
    //   2. shell: invalid params / no root  -> error; allowlisted root -> AutoProceed
    //   3. bridged: server, then server.tool allowlisted -> AutoProceed
    //   4. otherwise                        -> AwaitingConfirmation
    core::errors::Result<TrustDecision> decide(const protocol::ToolDescriptor& tool,
                                               const nlohmann::json& params) const;

private:
    core::errors::Result<TrustDecision> decide_shell(const protocol::ToolDescriptor& tool,
                                                     const nlohmann::json& params) const;
    core::errors::Result<TrustDecision> decide_bridged(const protocol::ToolDescriptor& tool,
                                                       const nlohmann::json& params) const;

    const AllowlistStore& store_;
};

}  // namespace trustgate::policy
