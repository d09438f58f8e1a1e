#pragma once
#include <string>
#include <utility>

namespace trustgate::protocol {

    // Which trust scope rules apply to a tool
    enum class ToolKind {
        Shell,   // local shell command, keyed by command root
        Bridged  // remote tool server method, keyed by server or server.tool
    };

    // Identity of an invocable capability. Built once at registration.
    struct ToolDescriptor {
        std::string name;
        ToolKind kind = ToolKind::Shell;
        std::string server_id;       // bridged only
        std::string server_tool_id;  // bridged only
        bool always_trusted = false;
    };

    inline ToolDescriptor make_shell_tool(std::string name, bool always_trusted = false) {
        ToolDescriptor tool;
        tool.name = std::move(name);
        tool.kind = ToolKind::Shell;
        tool.always_trusted = always_trusted;
        return tool;
    }

    inline ToolDescriptor make_bridged_tool(std::string name, std::string server_id,
                                            std::string server_tool_id,
                                            bool always_trusted = false) {
        ToolDescriptor tool;
        tool.name = std::move(name);
        tool.kind = ToolKind::Bridged;
        tool.server_id = std::move(server_id);
        tool.server_tool_id = std::move(server_tool_id);
        tool.always_trusted = always_trusted;
        return tool;
    }

    // How the agent asks for a tool to run
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "run_shell_command", "create_issue"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // What the execution collaborator hands back
    struct ToolResult {
        std::string tool_call_id;
        bool success;
        std::string output;
        std::string error_message;
        double duration_ms;
    };

    inline std::string to_string(const ToolKind kind) {
        switch (kind) {
            case ToolKind::Shell:
                return "shell";
            case ToolKind::Bridged:
                return "bridged";
            default:
                return "unknown";
        }
    }

} // namespace trustgate::protocol
