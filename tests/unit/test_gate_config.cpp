#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"

namespace {

using trustgate::core::config::ApprovalMode;
using trustgate::core::config::load_gate_config;
using trustgate::core::config::parse_gate_config;
using trustgate::core::errors::get_error;
using trustgate::core::errors::get_value;
using trustgate::core::errors::is_error;

TEST(GateConfigTest, EmptyObjectYieldsDefaults) {
    auto parsed = parse_gate_config("{}");
    ASSERT_FALSE(is_error(parsed));

    const auto& config = get_value(parsed);
    EXPECT_EQ(config.approval_mode, ApprovalMode::Default);
    EXPECT_EQ(config.shell_tool_name, "run_shell_command");
    EXPECT_TRUE(config.servers.empty());
    EXPECT_FALSE(config.journal_dir.has_value());
}

TEST(GateConfigTest, ParsesServersAndSessionSettings) {
    auto parsed = parse_gate_config(R"({
        "approval_mode": "yolo",
        "shell_tool_name": "shell",
        "journal_dir": "audit",
        "servers": [
            {"id": "github", "tools": ["create_issue", "list_prs"]},
            {"id": "docs", "trust": true, "tools": ["search"]}
        ]
    })");
    ASSERT_FALSE(is_error(parsed));

    const auto& config = get_value(parsed);
    EXPECT_EQ(config.approval_mode, ApprovalMode::Yolo);
    EXPECT_EQ(config.shell_tool_name, "shell");
    ASSERT_TRUE(config.journal_dir.has_value());
    EXPECT_EQ(config.journal_dir->string(), "audit");
    ASSERT_EQ(config.servers.size(), 2u);
    EXPECT_EQ(config.servers[0].id, "github");
    EXPECT_FALSE(config.servers[0].trust);
    EXPECT_EQ(config.servers[0].tools.size(), 2u);
    EXPECT_TRUE(config.servers[1].trust);
}

TEST(GateConfigTest, RejectsMalformedJson) {
    auto parsed = parse_gate_config("{not json");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
}

TEST(GateConfigTest, RejectsUnknownApprovalMode) {
    auto parsed = parse_gate_config(R"({"approval_mode": "auto_edit"})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
    EXPECT_FALSE(get_error(parsed).hint.empty());
}

TEST(GateConfigTest, RejectsServerWithoutId) {
    auto parsed = parse_gate_config(R"({"servers": [{"tools": ["x"]}]})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
}

TEST(GateConfigTest, RejectsNonBooleanTrust) {
    auto parsed = parse_gate_config(R"({"servers": [{"id": "github", "trust": "yes"}]})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
}

TEST(GateConfigTest, LoadFailsForMissingFile) {
    const auto missing = std::filesystem::current_path() / "__missing_gate_config__.json";
    auto loaded = load_gate_config(missing);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_not_found");
}

TEST(GateConfigTest, RejectsServerIdWithScopeSeparator) {
    auto parsed = parse_gate_config(R"({"servers": [{"id": "gh.admin", "tools": ["x"]}]})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
}

}  // namespace
