#include "session/tool_invocation_gate.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ConfirmationOutcome;
using protocol::InvocationResult;
using protocol::InvocationState;
using protocol::ToolDescriptor;

ToolInvocationGate::ToolInvocationGate(policy::AllowlistStore& store,
                                       std::shared_ptr<DecisionJournal> journal)
    : store_(store), evaluator_(store), journal_(std::move(journal)) {}

core::errors::Result<GateDecision> ToolInvocationGate::evaluate(
    const ToolDescriptor& tool, const nlohmann::json& params,
    std::shared_ptr<std::atomic_bool> cancel_token) {
    if (!cancel_token) {
        cancel_token = std::make_shared<std::atomic_bool>(false);
    }

    auto begun = registry_.begin(tool.name, cancel_token);
    if (core::errors::is_error(begun)) {
        return core::errors::get_error(begun);
    }
    const std::string invocation_id = core::errors::get_value(begun);

    auto decided = evaluator_.decide(tool, params);
    if (core::errors::is_error(decided)) {
        const auto& err = core::errors::get_error(decided);
        LOG_WARN("ToolInvocationGate: " + invocation_id + " rejected [" + err.code +
                 "]: " + err.message);
        if (journal_) {
            auto written = journal_->write_rejection(invocation_id, tool, err);
            if (core::errors::is_error(written)) {
                LOG_ERROR("ToolInvocationGate: journal write failed [" +
                          core::errors::get_error(written).code + "]");
            }
        }
        auto discarded = registry_.discard(invocation_id);
        if (core::errors::is_error(discarded)) {
            LOG_ERROR("ToolInvocationGate: failed to discard " + invocation_id + ": " +
                      core::errors::get_error(discarded).message);
        }
        return err;
    }
    const auto& decision = core::errors::get_value(decided);
    journal_evaluation(invocation_id, tool, decision);

    if (decision.state == InvocationState::AutoProceed) {
        auto marked = registry_.mark_auto_proceed(invocation_id);
        if (core::errors::is_error(marked)) {
            return core::errors::get_error(marked);
        }
        marked = registry_.mark_proceeded(invocation_id);
        if (core::errors::is_error(marked)) {
            return core::errors::get_error(marked);
        }
        LOG_INFO("ToolInvocationGate: " + invocation_id + " (" + tool.name +
                 ") auto-proceeds: " + decision.reason);
        return GateDecision{AutoProceed{invocation_id, decision.reason}};
    }

    if (!decision.pending.has_value()) {
        auto discarded = registry_.discard(invocation_id);
        if (core::errors::is_error(discarded)) {
            LOG_ERROR("ToolInvocationGate: failed to discard " + invocation_id + ": " +
                      core::errors::get_error(discarded).message);
        }
        return GateError{ErrorCategory::Internal,
                         "Trust decision is awaiting confirmation without details.",
                         "missing_confirmation_details"};
    }

    auto marked = registry_.mark_awaiting(invocation_id);
    if (core::errors::is_error(marked)) {
        return core::errors::get_error(marked);
    }

    auto request = std::make_shared<ConfirmationRequest>(
        invocation_id, *decision.pending, store_, cancel_token,
        [this](const ConfirmationRequest& settled,
               const std::optional<ConfirmationOutcome> outcome,
               const InvocationResult result) { complete(settled, outcome, result); });
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[invocation_id] = request;
    }
    LOG_INFO("ToolInvocationGate: " + invocation_id + " (" + tool.name +
             ") awaits confirmation for scope '" + decision.pending->fine_key.scope + "'");
    return GateDecision{std::move(request)};
}

core::errors::Result<InvocationResult> ToolInvocationGate::resolve(
    ConfirmationRequest& request, const ConfirmationOutcome outcome) {
    auto resolved = request.resolve(outcome);
    if (!core::errors::is_error(resolved) && request.is_cancelled()) {
        LOG_INFO("ToolInvocationGate: " + request.invocation_id() +
                 " was cancelled; ignoring outcome " + protocol::to_string(outcome));
    }
    return resolved;
}

core::errors::Result<InvocationState> ToolInvocationGate::cancel(
    const std::string& invocation_id) {
    std::shared_ptr<ConfirmationRequest> request;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(invocation_id);
        if (it != pending_.end()) {
            request = it->second.lock();
        }
    }

    if (!request) {
        auto cancelled = registry_.cancel(invocation_id);
        if (!core::errors::is_error(cancelled)) {
            LOG_INFO("ToolInvocationGate: " + invocation_id + " cancelled");
        }
        return cancelled;
    }

    if (!request->abandon()) {
        return GateError{ErrorCategory::Input,
                         "Invocation already resolved: " + invocation_id,
                         "invalid_state_transition"};
    }
    LOG_INFO("ToolInvocationGate: " + invocation_id + " cancelled");
    return registry_.get_state(invocation_id);
}

core::errors::Result<InvocationState> ToolInvocationGate::invocation_state(
    const std::string& invocation_id) const {
    return registry_.get_state(invocation_id);
}

void ToolInvocationGate::complete(const ConfirmationRequest& request,
                                  const std::optional<ConfirmationOutcome> outcome,
                                  const InvocationResult result) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(request.invocation_id());
    }

    auto marked = result == InvocationResult::Proceeded
                      ? registry_.mark_proceeded(request.invocation_id(), outcome)
                      : registry_.mark_cancelled(request.invocation_id(), outcome);
    if (core::errors::is_error(marked)) {
        LOG_ERROR("ToolInvocationGate: " + request.invocation_id() + " state not updated: " +
                  core::errors::get_error(marked).message);
    }

    journal_resolution(request, outcome, result);
}

void ToolInvocationGate::journal_evaluation(const std::string& invocation_id,
                                            const ToolDescriptor& tool,
                                            const policy::TrustDecision& decision) const {
    if (!journal_) {
        return;
    }
    auto written = journal_->write_evaluation(invocation_id, tool, decision);
    if (core::errors::is_error(written)) {
        LOG_ERROR("ToolInvocationGate: journal write failed [" +
                  core::errors::get_error(written).code + "]: " +
                  core::errors::get_error(written).message);
    }
}

void ToolInvocationGate::journal_resolution(const ConfirmationRequest& request,
                                            const std::optional<ConfirmationOutcome> outcome,
                                            const InvocationResult result) const {
    if (!journal_) {
        return;
    }
    auto written = journal_->write_resolution(request.invocation_id(), outcome, result,
                                              request.remembered_key());
    if (core::errors::is_error(written)) {
        LOG_ERROR("ToolInvocationGate: journal write failed [" +
                  core::errors::get_error(written).code + "]: " +
                  core::errors::get_error(written).message);
    }
}

}  // namespace trustgate::session
