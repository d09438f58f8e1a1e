#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace trustgate::tools {

// Tool descriptors of one session. The always_trusted flag is fixed here,
// from the session approval mode and per-server trust settings.
class ToolRegistry {
public:
    explicit ToolRegistry(core::config::GateConfig config = {});

    core::errors::Result<protocol::ToolDescriptor> register_shell_tool();
    core::errors::Result<protocol::ToolDescriptor> register_shell_tool(const std::string& name);

    // Registered under the server tool id, or "<server>__<tool>" when taken.
    core::errors::Result<protocol::ToolDescriptor> register_bridged_tool(
        const std::string& server_id, const std::string& server_tool_id);

    // Shell tool plus every tool listed under "servers" in the config.
    core::errors::Result<std::size_t> register_from_config();

    const protocol::ToolDescriptor* find(const std::string& name) const;
    std::vector<std::string> tool_names() const;

private:
    bool is_server_trusted(const std::string& server_id) const;

    core::config::GateConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, protocol::ToolDescriptor> tools_;
};

}  // namespace trustgate::tools
