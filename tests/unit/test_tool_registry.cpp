#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace {

using trustgate::core::config::ApprovalMode;
using trustgate::core::config::BridgedServerConfig;
using trustgate::core::config::GateConfig;
using trustgate::core::errors::get_error;
using trustgate::core::errors::get_value;
using trustgate::core::errors::is_error;
using trustgate::protocol::ToolKind;
using trustgate::tools::ToolRegistry;

GateConfig make_config() {
    GateConfig config;
    BridgedServerConfig github;
    github.id = "github";
    github.tools = {"create_issue", "search"};
    BridgedServerConfig docs;
    docs.id = "docs";
    docs.trust = true;
    docs.tools = {"search"};
    config.servers = {github, docs};
    return config;
}

TEST(ToolRegistryTest, RegistersShellAndBridgedToolsFromConfig) {
    ToolRegistry registry(make_config());
    auto registered = registry.register_from_config();
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), 4u);

    const std::vector<std::string> expected = {"create_issue", "docs__search",
                                               "run_shell_command", "search"};
    EXPECT_EQ(registry.tool_names(), expected);

    const auto* shell = registry.find("run_shell_command");
    ASSERT_TRUE(shell != nullptr);
    EXPECT_EQ(shell->kind, ToolKind::Shell);
    EXPECT_FALSE(shell->always_trusted);
}

TEST(ToolRegistryTest, NameCollisionIsQualifiedWithServer) {
    ToolRegistry registry(make_config());
    ASSERT_FALSE(is_error(registry.register_from_config()));

    const auto* first = registry.find("search");
    ASSERT_TRUE(first != nullptr);
    EXPECT_EQ(first->server_id, "github");

    const auto* second = registry.find("docs__search");
    ASSERT_TRUE(second != nullptr);
    EXPECT_EQ(second->kind, ToolKind::Bridged);
    EXPECT_EQ(second->server_id, "docs");
    EXPECT_EQ(second->server_tool_id, "search");
}

TEST(ToolRegistryTest, TrustedServerToolsAreAlwaysTrusted) {
    ToolRegistry registry(make_config());
    ASSERT_FALSE(is_error(registry.register_from_config()));

    EXPECT_TRUE(registry.find("docs__search")->always_trusted);
    EXPECT_FALSE(registry.find("create_issue")->always_trusted);
}

TEST(ToolRegistryTest, YoloModeTrustsEveryTool) {
    GateConfig config = make_config();
    config.approval_mode = ApprovalMode::Yolo;
    ToolRegistry registry(config);
    ASSERT_FALSE(is_error(registry.register_from_config()));

    for (const auto& name : registry.tool_names()) {
        EXPECT_TRUE(registry.find(name)->always_trusted) << name;
    }
}

TEST(ToolRegistryTest, RejectsDuplicateShellTool) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_shell_tool()));

    auto again = registry.register_shell_tool();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_tool");
}

TEST(ToolRegistryTest, RejectsBridgedToolWithoutServer) {
    ToolRegistry registry;
    auto result = registry.register_bridged_tool("", "create_issue");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_tool");
    EXPECT_TRUE(registry.find("create_issue") == nullptr);
}

TEST(ToolRegistryTest, RejectsServerIdWithScopeSeparator) {
    ToolRegistry registry;
    auto result = registry.register_bridged_tool("gh.admin", "delete_repo");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_tool");
    EXPECT_TRUE(registry.find("delete_repo") == nullptr);
}

}  // namespace
