#include "core/config/gate_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace trustgate::core::config {

using errors::ErrorCategory;
using errors::GateError;
using nlohmann::json;

namespace {

GateError invalid_config(const std::string& message) {
    return GateError{ErrorCategory::Input, message, "invalid_config"};
}

errors::Result<BridgedServerConfig> parse_server(const json& entry) {
    if (!entry.is_object()) {
        return invalid_config("Each entry in 'servers' must be an object.");
    }

    BridgedServerConfig server;
    auto id_it = entry.find("id");
    if (id_it == entry.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        return invalid_config("Server entries require a non-empty string 'id'.");
    }
    server.id = id_it->get<std::string>();
    if (server.id.find('.') != std::string::npos) {
        return invalid_config("Server id '" + server.id + "' must not contain '.'.");
    }

    auto trust_it = entry.find("trust");
    if (trust_it != entry.end()) {
        if (!trust_it->is_boolean()) {
            return invalid_config("Server '" + server.id + "': 'trust' must be a boolean.");
        }
        server.trust = trust_it->get<bool>();
    }

    auto tools_it = entry.find("tools");
    if (tools_it != entry.end()) {
        if (!tools_it->is_array()) {
            return invalid_config("Server '" + server.id + "': 'tools' must be an array.");
        }
        for (const auto& tool : *tools_it) {
            if (!tool.is_string() || tool.get<std::string>().empty()) {
                return invalid_config("Server '" + server.id +
                                      "': tool names must be non-empty strings.");
            }
            server.tools.push_back(tool.get<std::string>());
        }
    }
    return server;
}

}  // namespace

errors::Result<ApprovalMode> approval_mode_from_string(const std::string& value) {
    if (value == "default") {
        return ApprovalMode::Default;
    }
    if (value == "yolo") {
        return ApprovalMode::Yolo;
    }
    return GateError{ErrorCategory::Input, "Unknown approval mode: " + value,
                     "invalid_config", "Use \"default\" or \"yolo\"."};
}

std::string to_string(const ApprovalMode mode) {
    switch (mode) {
        case ApprovalMode::Default:
            return "default";
        case ApprovalMode::Yolo:
            return "yolo";
        default:
            return "unknown";
    }
}

errors::Result<GateConfig> parse_gate_config(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return invalid_config("Config is not valid JSON.");
    }
    if (!root.is_object()) {
        return invalid_config("Config root must be a JSON object.");
    }

    GateConfig config;

    auto mode_it = root.find("approval_mode");
    if (mode_it != root.end()) {
        if (!mode_it->is_string()) {
            return invalid_config("'approval_mode' must be a string.");
        }
        auto mode = approval_mode_from_string(mode_it->get<std::string>());
        if (errors::is_error(mode)) {
            return errors::get_error(mode);
        }
        config.approval_mode = errors::get_value(mode);
    }

    auto shell_it = root.find("shell_tool_name");
    if (shell_it != root.end()) {
        if (!shell_it->is_string() || shell_it->get<std::string>().empty()) {
            return invalid_config("'shell_tool_name' must be a non-empty string.");
        }
        config.shell_tool_name = shell_it->get<std::string>();
    }

    auto servers_it = root.find("servers");
    if (servers_it != root.end()) {
        if (!servers_it->is_array()) {
            return invalid_config("'servers' must be an array.");
        }
        for (const auto& entry : *servers_it) {
            auto server = parse_server(entry);
            if (errors::is_error(server)) {
                return errors::get_error(server);
            }
            config.servers.push_back(errors::get_value(server));
        }
    }

    auto journal_it = root.find("journal_dir");
    if (journal_it != root.end() && !journal_it->is_null()) {
        if (!journal_it->is_string() || journal_it->get<std::string>().empty()) {
            return invalid_config("'journal_dir' must be a non-empty string.");
        }
        config.journal_dir = std::filesystem::path(journal_it->get<std::string>());
    }

    return config;
}

errors::Result<GateConfig> load_gate_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input, "Config file not found: " + path.string(),
                         "config_not_found"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_gate_config(buffer.str());
}

}  // namespace trustgate::core::config
