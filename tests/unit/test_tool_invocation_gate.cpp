#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "policy/allowlist_store.hpp"
#include "protocol/confirmation_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "session/decision_journal.hpp"
#include "session/tool_invocation_gate.hpp"

namespace {

using trustgate::core::errors::get_error;
using trustgate::core::errors::get_value;
using trustgate::core::errors::is_error;
using trustgate::policy::AllowlistStore;
using trustgate::policy::bridged_server_key;
using trustgate::policy::shell_root_key;
using trustgate::protocol::ConfirmationOutcome;
using trustgate::protocol::InvocationResult;
using trustgate::protocol::InvocationState;
using trustgate::protocol::make_bridged_tool;
using trustgate::protocol::make_shell_tool;
using trustgate::protocol::ShellConfirmationDetails;
using trustgate::protocol::ToolKind;
using trustgate::session::AutoProceed;
using trustgate::session::ConfirmationRequest;
using trustgate::session::DecisionJournal;
using trustgate::session::GateDecision;
using trustgate::session::ToolInvocationGate;
using nlohmann::json;

json shell_call(const std::string& command) {
    return json{{"command", command}};
}

std::shared_ptr<ConfirmationRequest> as_request(const GateDecision& decision) {
    auto* request = std::get_if<std::shared_ptr<ConfirmationRequest>>(&decision);
    return request == nullptr ? nullptr : *request;
}

bool is_auto_proceed(const GateDecision& decision) {
    return std::holds_alternative<AutoProceed>(decision);
}

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_gate_" + trustgate::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(ToolInvocationGateTest, ProceedAlwaysTrustsEveryCommandWithSameRoot) {
    AllowlistStore store;
    ToolInvocationGate gate(store);
    const auto shell = make_shell_tool("run_shell_command");

    auto first = gate.evaluate(shell, shell_call("git status"));
    ASSERT_FALSE(is_error(first));
    auto request = as_request(get_value(first));
    ASSERT_TRUE(request != nullptr);
    const auto& details = std::get<ShellConfirmationDetails>(request->details());
    EXPECT_EQ(details.root_command, "git");

    auto resolved = gate.resolve(*request, ConfirmationOutcome::ProceedAlways);
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), InvocationResult::Proceeded);
    EXPECT_TRUE(store.is_allowed(ToolKind::Shell, "git"));

    auto second = gate.evaluate(shell, shell_call("git log --oneline"));
    ASSERT_FALSE(is_error(second));
    ASSERT_TRUE(is_auto_proceed(get_value(second)));
    EXPECT_EQ(std::get<AutoProceed>(get_value(second)).reason, "allowlisted_root");
}

TEST(ToolInvocationGateTest, ProceedOnceAsksAgainNextTime) {
    AllowlistStore store;
    ToolInvocationGate gate(store);
    const auto shell = make_shell_tool("run_shell_command");

    auto first = gate.evaluate(shell, shell_call("npm test"));
    ASSERT_FALSE(is_error(first));
    auto request = as_request(get_value(first));
    ASSERT_TRUE(request != nullptr);

    auto resolved = gate.resolve(*request, ConfirmationOutcome::ProceedOnce);
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), InvocationResult::Proceeded);
    EXPECT_EQ(store.size(), 0u);

    auto state = gate.invocation_state(request->invocation_id());
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Proceeded);

    auto second = gate.evaluate(shell, shell_call("npm test"));
    ASSERT_FALSE(is_error(second));
    EXPECT_TRUE(as_request(get_value(second)) != nullptr);
}

TEST(ToolInvocationGateTest, ProceedAlwaysServerTrustsOnlyThatServer) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto first = gate.evaluate(make_bridged_tool("create_issue", "github", "create_issue"),
                               json{{"title", "Bug"}});
    ASSERT_FALSE(is_error(first));
    auto request = as_request(get_value(first));
    ASSERT_TRUE(request != nullptr);
    EXPECT_EQ(request->title(), "Confirm Bridged Tool Execution");

    auto resolved = gate.resolve(*request, ConfirmationOutcome::ProceedAlwaysServer);
    ASSERT_FALSE(is_error(resolved));
    EXPECT_TRUE(store.is_allowed(bridged_server_key("github")));

    auto same_server = gate.evaluate(make_bridged_tool("list_prs", "github", "list_prs"),
                                     json::object());
    ASSERT_FALSE(is_error(same_server));
    EXPECT_TRUE(is_auto_proceed(get_value(same_server)));

    auto other_server = gate.evaluate(make_bridged_tool("post_message", "slack", "post_message"),
                                      json::object());
    ASSERT_FALSE(is_error(other_server));
    EXPECT_TRUE(as_request(get_value(other_server)) != nullptr);
}

TEST(ToolInvocationGateTest, CancellationWhileAwaitingYieldsCancelled) {
    AllowlistStore store;
    ToolInvocationGate gate(store);
    auto token = std::make_shared<std::atomic_bool>(false);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"),
                                   shell_call("git push"), token);
    ASSERT_FALSE(is_error(evaluated));
    auto request = as_request(get_value(evaluated));
    ASSERT_TRUE(request != nullptr);

    token->store(true);
    auto resolved = gate.resolve(*request, ConfirmationOutcome::ProceedAlways);
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), InvocationResult::Cancelled);
    EXPECT_EQ(store.size(), 0u);

    auto state = gate.invocation_state(request->invocation_id());
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Cancelled);
}

TEST(ToolInvocationGateTest, CancelByIdAbandonsPendingRequest) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"), shell_call("make"));
    ASSERT_FALSE(is_error(evaluated));
    auto request = as_request(get_value(evaluated));
    ASSERT_TRUE(request != nullptr);

    auto cancelled = gate.cancel(request->invocation_id());
    ASSERT_FALSE(is_error(cancelled));
    EXPECT_EQ(get_value(cancelled), InvocationState::Cancelled);
    EXPECT_TRUE(request->is_cancelled());
    EXPECT_TRUE(request->is_resolved());

    auto resolved = gate.resolve(*request, ConfirmationOutcome::ProceedAlways);
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).code, "already_resolved");
    EXPECT_FALSE(store.is_allowed(shell_root_key("make")));

    auto state = gate.invocation_state(request->invocation_id());
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Cancelled);
}

TEST(ToolInvocationGateTest, ResolvingThroughRequestSettlesInvocation) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"),
                                   shell_call("git status"));
    ASSERT_FALSE(is_error(evaluated));
    auto request = as_request(get_value(evaluated));
    ASSERT_TRUE(request != nullptr);

    auto resolved = request->resolve(ConfirmationOutcome::ProceedAlways);
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), InvocationResult::Proceeded);

    auto state = gate.invocation_state(request->invocation_id());
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Proceeded);

    auto cancelled = gate.cancel(request->invocation_id());
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "invalid_state_transition");
    EXPECT_FALSE(request->is_cancelled());

    state = gate.invocation_state(request->invocation_id());
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Proceeded);
    EXPECT_TRUE(store.is_allowed(shell_root_key("git")));
}

TEST(ToolInvocationGateTest, AbandoningRequestMarksInvocationCancelled) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_bridged_tool("create_issue", "github", "create_issue"),
                                   json::object());
    ASSERT_FALSE(is_error(evaluated));
    auto request = as_request(get_value(evaluated));
    ASSERT_TRUE(request != nullptr);

    EXPECT_TRUE(request->abandon());
    EXPECT_TRUE(request->is_cancelled());

    auto state = gate.invocation_state(request->invocation_id());
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Cancelled);

    auto cancelled = gate.cancel(request->invocation_id());
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "invalid_state_transition");
}

TEST(ToolInvocationGateTest, AllowlistedInvocationDoesNotTouchStore) {
    AllowlistStore store;
    store.allow(shell_root_key("python3"));
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"),
                                   shell_call("/usr/bin/python3 -m pip install package"));
    ASSERT_FALSE(is_error(evaluated));
    EXPECT_TRUE(is_auto_proceed(get_value(evaluated)));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.entries(ToolKind::Shell), std::vector<std::string>{"python3"});
}

TEST(ToolInvocationGateTest, CancelUnknownInvocationFails) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto cancelled = gate.cancel("inv-missing");
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "invocation_not_found");
}

TEST(ToolInvocationGateTest, AlwaysTrustedToolNeverAsks) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_bridged_tool("search", "docs", "search", true),
                                   json::object());
    ASSERT_FALSE(is_error(evaluated));
    ASSERT_TRUE(is_auto_proceed(get_value(evaluated)));

    const auto& auto_proceed = std::get<AutoProceed>(get_value(evaluated));
    EXPECT_EQ(auto_proceed.reason, "always_trusted");
    auto state = gate.invocation_state(auto_proceed.invocation_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Proceeded);
    EXPECT_EQ(store.size(), 0u);
}

TEST(ToolInvocationGateTest, SecondResolveIsRejected) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"), shell_call("ls"));
    ASSERT_FALSE(is_error(evaluated));
    auto request = as_request(get_value(evaluated));
    ASSERT_TRUE(request != nullptr);

    ASSERT_FALSE(is_error(gate.resolve(*request, ConfirmationOutcome::Cancel)));
    auto again = gate.resolve(*request, ConfirmationOutcome::ProceedAlways);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "already_resolved");
    EXPECT_EQ(store.size(), 0u);
}

TEST(ToolInvocationGateTest, RejectedEvaluationLeavesNoInvocation) {
    AllowlistStore store;
    ToolInvocationGate gate(store);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"), shell_call(""));
    ASSERT_TRUE(is_error(evaluated));
    EXPECT_EQ(get_error(evaluated).code, "empty_command");
    EXPECT_EQ(gate.registry().invocation_count(), 0u);
}

TEST(ToolInvocationGateTest, IndependentStoresDoNotShareDecisions) {
    AllowlistStore first_store;
    AllowlistStore second_store;
    ToolInvocationGate first_gate(first_store);
    ToolInvocationGate second_gate(second_store);

    first_store.allow(shell_root_key("git"));
    auto evaluated = second_gate.evaluate(make_shell_tool("run_shell_command"),
                                          shell_call("git status"));
    ASSERT_FALSE(is_error(evaluated));
    EXPECT_TRUE(as_request(get_value(evaluated)) != nullptr);
}

TEST(ToolInvocationGateTest, JournalsEvaluationAndResolution) {
    TempWorkspace workspace;
    AllowlistStore store;
    auto journal = std::make_shared<DecisionJournal>(workspace.root(), "session-test");
    ToolInvocationGate gate(store, journal);

    auto evaluated = gate.evaluate(make_shell_tool("run_shell_command"), shell_call("git status"));
    ASSERT_FALSE(is_error(evaluated));
    auto request = as_request(get_value(evaluated));
    ASSERT_TRUE(request != nullptr);
    ASSERT_FALSE(is_error(request->resolve(ConfirmationOutcome::ProceedAlways)));

    std::ifstream in(workspace.root() / "session-test.jsonl");
    std::vector<json> events;
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line));
    }

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].at("event").get<std::string>(), "evaluated");
    EXPECT_EQ(events[0].at("payload").at("decision").get<std::string>(),
              "awaiting_confirmation");
    EXPECT_EQ(events[0].at("payload").at("scope").get<std::string>(), "git");
    EXPECT_EQ(events[1].at("event").get<std::string>(), "resolved");
    EXPECT_EQ(events[1].at("payload").at("outcome").get<std::string>(), "proceed_always");
    EXPECT_EQ(events[1].at("payload").at("remembered").at("scope").get<std::string>(), "git");
    EXPECT_EQ(events[1].at("invocation_id").get<std::string>(), request->invocation_id());
}

}  // namespace
