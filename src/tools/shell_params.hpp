#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"

namespace trustgate::tools {

struct ShellParams {
    std::string command;
    std::optional<std::string> directory;
    std::optional<std::string> description;
};

core::errors::Result<ShellParams> parse_shell_params(const nlohmann::json& params);

// "npm test [in packages/core] (Run tests for core package)"
std::string describe_shell_invocation(const ShellParams& params);

}  // namespace trustgate::tools
