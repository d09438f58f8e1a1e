#include "tools/shell_params.hpp"

#include <algorithm>
#include <cctype>

namespace trustgate::tools {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

core::errors::Result<std::optional<std::string>> optional_string(
    const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return GateError{ErrorCategory::Validation,
                         std::string("Shell parameter '") + key + "' must be a string.",
                         "invalid_params"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

}  // namespace

core::errors::Result<ShellParams> parse_shell_params(const nlohmann::json& params) {
    if (!params.is_object()) {
        return GateError{ErrorCategory::Validation,
                         "Shell parameters must be a JSON object.", "invalid_params"};
    }

    auto command_it = params.find("command");
    if (command_it == params.end() || !command_it->is_string()) {
        return GateError{ErrorCategory::Validation,
                         "Shell parameters must include a string 'command'.",
                         "missing_command"};
    }

    ShellParams parsed;
    parsed.command = command_it->get<std::string>();
    if (is_blank(parsed.command)) {
        return GateError{ErrorCategory::Validation, "Command cannot be empty.",
                         "empty_command"};
    }

    auto directory = optional_string(params, "directory");
    if (core::errors::is_error(directory)) {
        return core::errors::get_error(directory);
    }
    parsed.directory = core::errors::get_value(directory);

    auto description = optional_string(params, "description");
    if (core::errors::is_error(description)) {
        return core::errors::get_error(description);
    }
    parsed.description = core::errors::get_value(description);

    return parsed;
}

std::string describe_shell_invocation(const ShellParams& params) {
    std::string text = params.command;
    if (params.directory.has_value()) {
        text += " [in " + params.directory.value() + "]";
    }
    if (params.description.has_value()) {
        text += " (" + params.description.value() + ")";
    }
    return text;
}

}  // namespace trustgate::tools
