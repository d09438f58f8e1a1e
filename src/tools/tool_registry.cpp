#include "tools/tool_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/allowlist_store.hpp"

namespace trustgate::tools {

using core::config::ApprovalMode;
using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ToolDescriptor;

ToolRegistry::ToolRegistry(core::config::GateConfig config) : config_(std::move(config)) {}

bool ToolRegistry::is_server_trusted(const std::string& server_id) const {
    for (const auto& server : config_.servers) {
        if (server.id == server_id) {
            return server.trust;
        }
    }
    return false;
}

core::errors::Result<ToolDescriptor> ToolRegistry::register_shell_tool() {
    return register_shell_tool(config_.shell_tool_name);
}

core::errors::Result<ToolDescriptor> ToolRegistry::register_shell_tool(const std::string& name) {
    if (name.empty()) {
        return GateError{ErrorCategory::Input, "Tool name cannot be empty.", "invalid_tool"};
    }

    const bool trusted = config_.approval_mode == ApprovalMode::Yolo;
    ToolDescriptor tool = protocol::make_shell_tool(name, trusted);

    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.find(name) != tools_.end()) {
        return GateError{ErrorCategory::Input, "Tool already registered: " + name,
                         "duplicate_tool"};
    }
    tools_.emplace(name, tool);
    LOG_DEBUG("ToolRegistry: registered shell tool " + name +
              (trusted ? " (always trusted)" : ""));
    return tool;
}

core::errors::Result<ToolDescriptor> ToolRegistry::register_bridged_tool(
    const std::string& server_id, const std::string& server_tool_id) {
    if (server_id.empty() || server_tool_id.empty()) {
        return GateError{ErrorCategory::Input,
                         "Bridged tools need both a server id and a tool id.",
                         "invalid_tool"};
    }
    if (!policy::is_valid_server_id(server_id)) {
        return GateError{ErrorCategory::Input,
                         "Bridged server id must not contain '.': " + server_id,
                         "invalid_tool"};
    }

    const bool trusted =
        config_.approval_mode == ApprovalMode::Yolo || is_server_trusted(server_id);

    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = server_tool_id;
    if (tools_.find(name) != tools_.end()) {
        name = server_id + "__" + server_tool_id;
    }
    if (tools_.find(name) != tools_.end()) {
        return GateError{ErrorCategory::Input, "Tool already registered: " + name,
                         "duplicate_tool"};
    }

    ToolDescriptor tool = protocol::make_bridged_tool(name, server_id, server_tool_id, trusted);
    tools_.emplace(name, tool);
    LOG_DEBUG("ToolRegistry: registered bridged tool " + name + " from " + server_id +
              (trusted ? " (always trusted)" : ""));
    return tool;
}

core::errors::Result<std::size_t> ToolRegistry::register_from_config() {
    std::size_t registered = 0;
    auto shell = register_shell_tool();
    if (core::errors::is_error(shell)) {
        return core::errors::get_error(shell);
    }
    ++registered;

    for (const auto& server : config_.servers) {
        for (const auto& tool_id : server.tools) {
            auto bridged = register_bridged_tool(server.id, tool_id);
            if (core::errors::is_error(bridged)) {
                return core::errors::get_error(bridged);
            }
            ++registered;
        }
    }
    return registered;
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(tools_.size());
        for (const auto& entry : tools_) {
            names.push_back(entry.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace trustgate::tools
