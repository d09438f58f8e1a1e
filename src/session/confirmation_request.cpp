#include "session/confirmation_request.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ConfirmationOutcome;
using protocol::InvocationResult;

ConfirmationRequest::ConfirmationRequest(std::string invocation_id,
                                         policy::PendingConfirmation pending,
                                         policy::AllowlistStore& store,
                                         std::shared_ptr<std::atomic_bool> cancel_token,
                                         CompletionHook on_complete)
    : invocation_id_(std::move(invocation_id)),
      pending_(std::move(pending)),
      store_(store),
      cancel_token_(std::move(cancel_token)),
      on_complete_(std::move(on_complete)) {}

core::errors::Result<InvocationResult> ConfirmationRequest::resolve(
    const ConfirmationOutcome outcome) {
    std::optional<ConfirmationOutcome> applied = outcome;
    InvocationResult result = InvocationResult::Cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result_.has_value()) {
            LOG_WARN("ConfirmationRequest: " + invocation_id_ + " resolved twice (" +
                     protocol::to_string(outcome) + " ignored)");
            return GateError{ErrorCategory::Internal,
                             "Confirmation request already resolved: " + invocation_id_,
                             "already_resolved"};
        }

        if (cancel_token_ && cancel_token_->load()) {
            LOG_INFO("ConfirmationRequest: " + invocation_id_ +
                     " cancelled before resolution; outcome ignored");
            applied.reset();
            result = InvocationResult::Cancelled;
        } else {
            switch (outcome) {
                case ConfirmationOutcome::Cancel:
                    result = InvocationResult::Cancelled;
                    break;
                case ConfirmationOutcome::ProceedOnce:
                    result = InvocationResult::Proceeded;
                    break;
                case ConfirmationOutcome::ProceedAlways:
                case ConfirmationOutcome::ProceedAlwaysTool:
                    store_.allow(pending_.fine_key);
                    remembered_ = pending_.fine_key;
                    result = InvocationResult::Proceeded;
                    break;
                case ConfirmationOutcome::ProceedAlwaysServer:
                    if (!pending_.coarse_key.has_value()) {
                        return GateError{ErrorCategory::Input,
                                         "Outcome proceed_always_server does not apply to " +
                                             protocol::to_string(pending_.kind) + " tools.",
                                         "outcome_not_applicable",
                                         "Use proceed_always to remember the command root."};
                    }
                    store_.allow(*pending_.coarse_key);
                    remembered_ = pending_.coarse_key;
                    result = InvocationResult::Proceeded;
                    break;
                default:
                    return GateError{ErrorCategory::Input, "Unknown confirmation outcome.",
                                     "unknown_outcome"};
            }
            LOG_INFO("ConfirmationRequest: " + invocation_id_ + " resolved with " +
                     protocol::to_string(outcome) + " -> " + protocol::to_string(result));
        }
        result_ = result;
    }

    if (on_complete_) {
        on_complete_(*this, applied, result);
    }
    return result;
}

bool ConfirmationRequest::abandon() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result_.has_value()) {
            return false;
        }
        result_ = InvocationResult::Cancelled;
        if (cancel_token_) {
            cancel_token_->store(true);
        }
    }

    if (on_complete_) {
        on_complete_(*this, std::nullopt, InvocationResult::Cancelled);
    }
    return true;
}

bool ConfirmationRequest::is_resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_.has_value();
}

bool ConfirmationRequest::is_cancelled() const {
    return cancel_token_ && cancel_token_->load();
}

std::optional<InvocationResult> ConfirmationRequest::result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

std::optional<policy::AllowlistKey> ConfirmationRequest::remembered_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remembered_;
}

}  // namespace trustgate::session
