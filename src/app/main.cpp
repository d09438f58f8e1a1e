#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "app/console_prompter.hpp"
#include "core/config/gate_config.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/allowlist_store.hpp"
#include "policy/command_root.hpp"
#include "protocol/plan_contract.hpp"
#include "runtime/plan_runner.hpp"
#include "session/decision_journal.hpp"
#include "session/tool_invocation_gate.hpp"
#include "tools/tool_registry.hpp"

namespace {

int print_root(const std::string& command_line) {
    const std::string root = trustgate::policy::extract_command_root(command_line);
    if (root.empty()) {
        LOG_ERROR("No command root found in: " + command_line);
        return 1;
    }
    std::cout << root << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Session identity for every log line and the journal file name
    const std::string session_id = trustgate::core::config::generate_session_id();
    trustgate::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = trustgate::app::cli::parse_and_validate(argc, argv);
    if (trustgate::core::errors::is_error(parsed)) {
        const auto& err = trustgate::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = trustgate::core::errors::get_value(parsed);
    if (req.verbose) {
        trustgate::core::logging::Logger::get().set_min_level(
            trustgate::core::logging::LogLevel::DEBUG);
    }

    if (req.command == trustgate::protocol::CliCommand::Root) {
        return print_root(req.command_line.value());
    }

    // 3. Session configuration
    trustgate::core::config::GateConfig config;
    if (req.config_file.has_value()) {
        auto loaded = trustgate::core::config::load_gate_config(req.config_file.value());
        if (trustgate::core::errors::is_error(loaded)) {
            const auto& err = trustgate::core::errors::get_error(loaded);
            LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            return 3;
        }
        config = trustgate::core::errors::get_value(loaded);
    }
    if (req.yolo) {
        config.approval_mode = trustgate::core::config::ApprovalMode::Yolo;
    }
    if (req.journal_dir.has_value()) {
        config.journal_dir = req.journal_dir;
    }
    LOG_INFO("Approval mode: " + trustgate::core::config::to_string(config.approval_mode));

    trustgate::tools::ToolRegistry registry(config);
    auto registered = registry.register_from_config();
    if (trustgate::core::errors::is_error(registered)) {
        const auto& err = trustgate::core::errors::get_error(registered);
        LOG_ERROR("Tool registration failed [" + err.code + "]: " + err.message);
        return 3;
    }
    LOG_INFO("Registered " + std::to_string(trustgate::core::errors::get_value(registered)) +
             " tools");

    auto plan = trustgate::runtime::load_plan(req.plan_file.value());
    if (trustgate::core::errors::is_error(plan)) {
        const auto& err = trustgate::core::errors::get_error(plan);
        LOG_ERROR("Plan error [" + err.code + "]: " + err.message);
        return 4;
    }

    // 4. Session-owned allowlist; lives until main returns
    trustgate::policy::AllowlistStore allowlist;
    std::shared_ptr<trustgate::session::DecisionJournal> journal;
    if (config.journal_dir.has_value()) {
        journal = std::make_shared<trustgate::session::DecisionJournal>(
            config.journal_dir.value(), session_id);
    }
    trustgate::session::ToolInvocationGate gate(allowlist, journal);

    trustgate::app::ConsolePrompter prompter(std::cin, std::cout);
    trustgate::app::ReportingExecutor executor(std::cout);
    trustgate::runtime::PlanRunner runner(registry, gate, prompter, executor);

    auto run = runner.run(session_id, trustgate::core::errors::get_value(plan));
    if (trustgate::core::errors::is_error(run)) {
        const auto& err = trustgate::core::errors::get_error(run);
        LOG_ERROR("Run failed [" + err.code + "]: " + err.message);
        return 1;
    }

    const auto& result = trustgate::core::errors::get_value(run);
    for (const auto& step : result.steps) {
        LOG_INFO("Call " + step.call_id + " (" + step.tool_name + "): " +
                 trustgate::protocol::to_string(step.disposition) +
                 (step.executed ? (step.success ? ", ok" : ", failed") : ""));
        if (!step.output.empty()) {
            LOG_INFO("  output: " + step.output);
        }
    }
    LOG_INFO("Run summary: " + result.summary);

    if (journal) {
        auto path = journal->journal_path();
        if (!trustgate::core::errors::is_error(path)) {
            LOG_INFO("Decision journal: " + trustgate::core::errors::get_value(path).string());
        }
    }

    return result.status == trustgate::protocol::PlanStatus::Completed ? 0 : 1;
}
