#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "policy/allowlist_store.hpp"
#include "policy/trust_evaluator.hpp"
#include "protocol/confirmation_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace trustgate::session {

// Append-only JSONL audit trail of gate decisions, one file per session.
class DecisionJournal {
public:
    DecisionJournal(std::filesystem::path journal_dir, std::string session_id);

    core::errors::Result<std::filesystem::path> write_evaluation(
        const std::string& invocation_id, const protocol::ToolDescriptor& tool,
        const policy::TrustDecision& decision) const;

    core::errors::Result<std::filesystem::path> write_resolution(
        const std::string& invocation_id, std::optional<protocol::ConfirmationOutcome> outcome,
        protocol::InvocationResult result,
        const std::optional<policy::AllowlistKey>& remembered) const;

    core::errors::Result<std::filesystem::path> write_rejection(
        const std::string& invocation_id, const protocol::ToolDescriptor& tool,
        const core::errors::GateError& error) const;

    core::errors::Result<std::filesystem::path> journal_path() const;

    const std::string& session_id() const { return session_id_; }

private:
    core::errors::Result<std::filesystem::path> append_event(const std::string& event_json) const;

    std::filesystem::path journal_dir_;
    std::string session_id_;
    mutable std::mutex mutex_;
};

}  // namespace trustgate::session
