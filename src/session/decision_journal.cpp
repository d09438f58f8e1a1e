#include "session/decision_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json key_to_json(const policy::AllowlistKey& key) {
    json payload;
    payload["kind"] = protocol::to_string(key.kind);
    payload["scope"] = key.scope;
    return payload;
}

json make_event(const std::string& event_name, const std::string& session_id,
                const std::string& invocation_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = event_name;
    event["session_id"] = session_id;
    event["invocation_id"] = invocation_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

DecisionJournal::DecisionJournal(std::filesystem::path journal_dir, std::string session_id)
    : journal_dir_(std::move(journal_dir)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> DecisionJournal::journal_path() const {
    if (session_id_.empty()) {
        return GateError{ErrorCategory::Input, "Session ID cannot be empty.",
                         "invalid_session_id"};
    }
    if (journal_dir_.empty()) {
        return GateError{ErrorCategory::Input, "Journal directory cannot be empty.",
                         "invalid_journal_dir"};
    }

    std::error_code ec;
    if (std::filesystem::exists(journal_dir_, ec) &&
        !std::filesystem::is_directory(journal_dir_, ec)) {
        return GateError{ErrorCategory::Input,
                         "Journal path is not a directory: " + journal_dir_.string(),
                         "invalid_journal_dir"};
    }
    std::filesystem::create_directories(journal_dir_, ec);
    if (ec) {
        return GateError{ErrorCategory::Internal,
                         "Unable to create journal directory: " + journal_dir_.string(),
                         "journal_dir_create_failed"};
    }

    return journal_dir_ / (session_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> DecisionJournal::append_event(
    const std::string& event_json) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to open journal file: " + path.string(),
                         "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to write journal event: " + path.string(),
                         "journal_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> DecisionJournal::write_evaluation(
    const std::string& invocation_id, const protocol::ToolDescriptor& tool,
    const policy::TrustDecision& decision) const {
    json payload;
    payload["tool"] = tool.name;
    payload["kind"] = protocol::to_string(tool.kind);
    payload["decision"] = protocol::to_string(decision.state);
    payload["reason"] = decision.reason;
    if (decision.pending.has_value()) {
        payload["scope"] = decision.pending->fine_key.scope;
    }
    return append_event(make_event("evaluated", session_id_, invocation_id, payload).dump());
}

core::errors::Result<std::filesystem::path> DecisionJournal::write_resolution(
    const std::string& invocation_id, const std::optional<protocol::ConfirmationOutcome> outcome,
    const protocol::InvocationResult result,
    const std::optional<policy::AllowlistKey>& remembered) const {
    json payload;
    payload["outcome"] = outcome.has_value() ? protocol::to_string(outcome.value()) : "";
    payload["result"] = protocol::to_string(result);
    payload["remembered"] = remembered.has_value() ? key_to_json(remembered.value()) : json();
    return append_event(make_event("resolved", session_id_, invocation_id, payload).dump());
}

core::errors::Result<std::filesystem::path> DecisionJournal::write_rejection(
    const std::string& invocation_id, const protocol::ToolDescriptor& tool,
    const core::errors::GateError& error) const {
    json payload;
    payload["tool"] = tool.name;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    return append_event(make_event("rejected", session_id_, invocation_id, payload).dump());
}

}  // namespace trustgate::session
