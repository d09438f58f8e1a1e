#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"

namespace trustgate::core::config {

enum class ApprovalMode {
    Default,  // ask unless allowlisted
    Yolo      // fully trusted session: every tool is always trusted
};

struct BridgedServerConfig {
    std::string id;
    bool trust = false;
    std::vector<std::string> tools;
};

struct GateConfig {
    ApprovalMode approval_mode = ApprovalMode::Default;
    std::string shell_tool_name = "run_shell_command";
    std::vector<BridgedServerConfig> servers;
    std::optional<std::filesystem::path> journal_dir;
};

errors::Result<GateConfig> parse_gate_config(const std::string& text);
errors::Result<GateConfig> load_gate_config(const std::filesystem::path& path);

errors::Result<ApprovalMode> approval_mode_from_string(const std::string& value);
std::string to_string(ApprovalMode mode);

}  // namespace trustgate::core::config
