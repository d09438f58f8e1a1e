#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "policy/allowlist_store.hpp"
#include "policy/trust_evaluator.hpp"
#include "protocol/confirmation_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "session/confirmation_request.hpp"
#include "session/decision_journal.hpp"
#include "session/invocation_registry.hpp"

namespace trustgate::session {

// The invocation may run without asking anyone.
struct AutoProceed {
    std::string invocation_id;
    std::string reason;
};

using GateDecision = std::variant<AutoProceed, std::shared_ptr<ConfirmationRequest>>;

// Entry point of the trust gate. Two phases:
//   1. evaluate() returns AutoProceed or a pending ConfirmationRequest;
//   2. the outcome is applied, through resolve() or the request itself.
// Either way the gate records the final state, so the execution
// collaborator must only run after AutoProceed or a Proceeded result.
// The gate must outlive the requests it hands out.
class ToolInvocationGate {
public:
    explicit ToolInvocationGate(policy::AllowlistStore& store,
                                std::shared_ptr<DecisionJournal> journal = nullptr);

    core::errors::Result<GateDecision> evaluate(
        const protocol::ToolDescriptor& tool, const nlohmann::json& params,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // A fired cancel token skips the outcome entirely: Cancelled, no mutation.
    core::errors::Result<protocol::InvocationResult> resolve(
        ConfirmationRequest& request, protocol::ConfirmationOutcome outcome);

    // Fails with "invalid_state_transition" once the invocation has settled.
    core::errors::Result<protocol::InvocationState> cancel(const std::string& invocation_id);

    core::errors::Result<protocol::InvocationState> invocation_state(
        const std::string& invocation_id) const;

    const InvocationRegistry& registry() const { return registry_; }

private:
    void journal_evaluation(const std::string& invocation_id,
                            const protocol::ToolDescriptor& tool,
                            const policy::TrustDecision& decision) const;
    void journal_resolution(const ConfirmationRequest& request,
                            std::optional<protocol::ConfirmationOutcome> outcome,
                            protocol::InvocationResult result) const;
    void complete(const ConfirmationRequest& request,
                  std::optional<protocol::ConfirmationOutcome> outcome,
                  protocol::InvocationResult result);

    policy::AllowlistStore& store_;
    policy::TrustEvaluator evaluator_;
    std::shared_ptr<DecisionJournal> journal_;
    InvocationRegistry registry_;

    std::mutex pending_mutex_;
    std::unordered_map<std::string, std::weak_ptr<ConfirmationRequest>> pending_;
};

}  // namespace trustgate::session
