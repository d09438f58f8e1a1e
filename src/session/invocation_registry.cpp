#include "session/invocation_registry.hpp"
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ConfirmationOutcome;
using protocol::InvocationState;

namespace {

GateError not_found(const std::string& invocation_id) {
    return GateError{ErrorCategory::Input, "Invocation ID not found: " + invocation_id,
                     "invocation_not_found"};
}

}  // namespace

InvocationRegistry::InvocationRegistry(const std::size_t max_settled_records)
    : max_settled_records_(max_settled_records) {}

void InvocationRegistry::retire_locked(const std::string& invocation_id) {
    settled_order_.push_back(invocation_id);
    while (settled_order_.size() > max_settled_records_) {
        invocations_.erase(settled_order_.front());
        settled_order_.pop_front();
    }
}

bool InvocationRegistry::is_terminal(const InvocationState state) {
    return state == InvocationState::Proceeded || state == InvocationState::Cancelled;
}

bool InvocationRegistry::is_allowed_transition(const InvocationState from,
                                               const InvocationState to) {
    switch (from) {
        case InvocationState::Unchecked:
            return to == InvocationState::AutoProceed ||
                   to == InvocationState::AwaitingConfirmation;
        case InvocationState::AutoProceed:
            return to == InvocationState::Proceeded;
        case InvocationState::AwaitingConfirmation:
            return to == InvocationState::Proceeded || to == InvocationState::Cancelled;
        default:
            return false;
    }
}

core::errors::Result<std::string> InvocationRegistry::begin(
    const std::string& tool_name, std::shared_ptr<std::atomic_bool> cancel_token) {
    if (tool_name.empty()) {
        return GateError{ErrorCategory::Input, "Tool name cannot be empty.",
                         "invalid_tool"};
    }
    if (!cancel_token) {
        cancel_token = std::make_shared<std::atomic_bool>(false);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string invocation_id = core::config::generate_invocation_id();
        if (invocations_.find(invocation_id) != invocations_.end()) {
            continue;
        }

        InvocationRecord record;
        record.invocation_id = invocation_id;
        record.tool_name = tool_name;
        record.state = InvocationState::Unchecked;
        record.cancel_token = std::move(cancel_token);
        invocations_.emplace(invocation_id, std::move(record));
        LOG_DEBUG("InvocationRegistry: " + invocation_id + " created for " + tool_name);
        return invocation_id;
    }

    return GateError{ErrorCategory::Internal, "Unable to allocate unique invocation ID.",
                     "invocation_id_generation_failed"};
}

core::errors::Result<InvocationState> InvocationRegistry::mark_auto_proceed(
    const std::string& invocation_id) {
    return transition(invocation_id, InvocationState::AutoProceed, std::nullopt);
}

core::errors::Result<InvocationState> InvocationRegistry::mark_awaiting(
    const std::string& invocation_id) {
    return transition(invocation_id, InvocationState::AwaitingConfirmation, std::nullopt);
}

core::errors::Result<InvocationState> InvocationRegistry::mark_proceeded(
    const std::string& invocation_id, std::optional<ConfirmationOutcome> outcome) {
    return transition(invocation_id, InvocationState::Proceeded, outcome);
}

core::errors::Result<InvocationState> InvocationRegistry::mark_cancelled(
    const std::string& invocation_id, std::optional<ConfirmationOutcome> outcome) {
    return transition(invocation_id, InvocationState::Cancelled, outcome);
}

core::errors::Result<InvocationState> InvocationRegistry::cancel(
    const std::string& invocation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(invocation_id);
    if (it == invocations_.end()) {
        return not_found(invocation_id);
    }

    auto& record = it->second;
    if (is_terminal(record.state)) {
        return GateError{ErrorCategory::Input,
                         "Invocation is already terminal: " + protocol::to_string(record.state),
                         "invalid_state_transition"};
    }

    record.cancel_token->store(true);
    if (record.state == InvocationState::AwaitingConfirmation) {
        record.state = InvocationState::Cancelled;
        LOG_INFO("InvocationRegistry: " + invocation_id +
                 " transition awaiting_confirmation -> cancelled");
        retire_locked(invocation_id);
        return InvocationState::Cancelled;
    }
    return record.state;
}

core::errors::Result<InvocationState> InvocationRegistry::discard(
    const std::string& invocation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(invocation_id);
    if (it == invocations_.end()) {
        return not_found(invocation_id);
    }
    if (it->second.state != InvocationState::Unchecked) {
        return GateError{ErrorCategory::Input,
                         "Only unchecked invocations can be discarded: " + invocation_id,
                         "invalid_state_transition"};
    }
    invocations_.erase(it);
    return InvocationState::Unchecked;
}

core::errors::Result<InvocationState> InvocationRegistry::transition(
    const std::string& invocation_id, const InvocationState next_state,
    const std::optional<ConfirmationOutcome>& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(invocation_id);
    if (it == invocations_.end()) {
        return not_found(invocation_id);
    }

    auto& record = it->second;
    if (!is_allowed_transition(record.state, next_state)) {
        return GateError{ErrorCategory::Input,
                         "Invalid transition " + protocol::to_string(record.state) + " -> " +
                             protocol::to_string(next_state) + " for " + invocation_id,
                         "invalid_state_transition"};
    }

    const std::string prev = protocol::to_string(record.state);
    record.state = next_state;
    if (outcome.has_value()) {
        record.outcome = outcome;
    }
    LOG_DEBUG("InvocationRegistry: " + invocation_id + " transition " + prev + " -> " +
              protocol::to_string(next_state));
    if (is_terminal(next_state)) {
        retire_locked(invocation_id);
    }
    return next_state;
}

core::errors::Result<InvocationState> InvocationRegistry::get_state(
    const std::string& invocation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(invocation_id);
    if (it == invocations_.end()) {
        return not_found(invocation_id);
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> InvocationRegistry::get_cancel_token(
    const std::string& invocation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(invocation_id);
    if (it == invocations_.end()) {
        return not_found(invocation_id);
    }
    return it->second.cancel_token;
}

core::errors::Result<InvocationRecord> InvocationRegistry::get_record(
    const std::string& invocation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(invocation_id);
    if (it == invocations_.end()) {
        return not_found(invocation_id);
    }
    return it->second;
}

std::size_t InvocationRegistry::invocation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invocations_.size();
}

}  // namespace trustgate::session
