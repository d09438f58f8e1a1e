#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/gate_errors.hpp"
#include "protocol/confirmation_contract.hpp"

namespace trustgate::session {

struct InvocationRecord {
    std::string invocation_id;
    std::string tool_name;
    protocol::InvocationState state = protocol::InvocationState::Unchecked;
    std::optional<protocol::ConfirmationOutcome> outcome;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Live invocations are kept until they settle. Settled (Proceeded or
// Cancelled) records stay queryable until more than max_settled_records
// newer ones exist; the oldest are then dropped.
class InvocationRegistry {
public:
    static constexpr std::size_t kDefaultMaxSettledRecords = 1024;

    explicit InvocationRegistry(std::size_t max_settled_records = kDefaultMaxSettledRecords);

    // Creates an Unchecked record. A null token is replaced by a fresh one.
    core::errors::Result<std::string> begin(const std::string& tool_name,
                                            std::shared_ptr<std::atomic_bool> cancel_token);

    core::errors::Result<protocol::InvocationState> mark_auto_proceed(
        const std::string& invocation_id);
    core::errors::Result<protocol::InvocationState> mark_awaiting(
        const std::string& invocation_id);
    core::errors::Result<protocol::InvocationState> mark_proceeded(
        const std::string& invocation_id,
        std::optional<protocol::ConfirmationOutcome> outcome = std::nullopt);
    core::errors::Result<protocol::InvocationState> mark_cancelled(
        const std::string& invocation_id,
        std::optional<protocol::ConfirmationOutcome> outcome = std::nullopt);

    // Fires the cancel token. Awaiting invocations become Cancelled.
    core::errors::Result<protocol::InvocationState> cancel(const std::string& invocation_id);

    // Drops an Unchecked record whose evaluation failed.
    core::errors::Result<protocol::InvocationState> discard(const std::string& invocation_id);

    core::errors::Result<protocol::InvocationState> get_state(
        const std::string& invocation_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& invocation_id) const;
    core::errors::Result<InvocationRecord> get_record(const std::string& invocation_id) const;

    std::size_t invocation_count() const;

private:
    core::errors::Result<protocol::InvocationState> transition(
        const std::string& invocation_id, protocol::InvocationState next_state,
        const std::optional<protocol::ConfirmationOutcome>& outcome);
    void retire_locked(const std::string& invocation_id);
    static bool is_terminal(protocol::InvocationState state);
    static bool is_allowed_transition(protocol::InvocationState from,
                                      protocol::InvocationState to);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, InvocationRecord> invocations_;
    std::deque<std::string> settled_order_;
    std::size_t max_settled_records_;
};

}  // namespace trustgate::session
