#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "policy/allowlist_store.hpp"
#include "policy/trust_evaluator.hpp"
#include "protocol/confirmation_contract.hpp"

namespace trustgate::session {

// A pending decision for one invocation. Handed to the prompting
// collaborator, resolved at most once, then discarded.
class ConfirmationRequest {
public:
    // Runs once, outside the request lock, after whichever call settled the
    // request. The outcome is empty when cancellation settled it.
    using CompletionHook = std::function<void(const ConfirmationRequest&,
                                              std::optional<protocol::ConfirmationOutcome>,
                                              protocol::InvocationResult)>;

    ConfirmationRequest(std::string invocation_id, policy::PendingConfirmation pending,
                        policy::AllowlistStore& store,
                        std::shared_ptr<std::atomic_bool> cancel_token,
                        CompletionHook on_complete = nullptr);

    ConfirmationRequest(const ConfirmationRequest&) = delete;
    ConfirmationRequest& operator=(const ConfirmationRequest&) = delete;

    const std::string& invocation_id() const { return invocation_id_; }
    const std::string& title() const { return pending_.title; }
    protocol::ToolKind kind() const { return pending_.kind; }
    const protocol::ConfirmationDetails& details() const { return pending_.details; }

    // Scope that ProceedAlways / ProceedAlwaysTool would remember.
    const policy::AllowlistKey& fine_key() const { return pending_.fine_key; }
    // Scope that ProceedAlwaysServer would remember; bridged tools only.
    const std::optional<policy::AllowlistKey>& coarse_key() const { return pending_.coarse_key; }

    // Applies the outcome to the allowlist and returns the final result.
    // A fired cancel token turns any outcome into Cancelled. A second call
    // fails with "already_resolved" and leaves the allowlist untouched.
    core::errors::Result<protocol::InvocationResult> resolve(
        protocol::ConfirmationOutcome outcome);

    // Cooperative cancellation. Returns false if the request was already resolved.
    // Fires the cancel token when it wins.
    bool abandon();

    bool is_resolved() const;
    bool is_cancelled() const;
    std::optional<protocol::InvocationResult> result() const;
    std::optional<policy::AllowlistKey> remembered_key() const;

private:
    std::string invocation_id_;
    policy::PendingConfirmation pending_;
    policy::AllowlistStore& store_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    CompletionHook on_complete_;

    mutable std::mutex mutex_;
    std::optional<protocol::InvocationResult> result_;
    std::optional<policy::AllowlistKey> remembered_;
};

}  // namespace trustgate::session
