#pragma once
#include <string>
#include <filesystem>
#include <optional>

namespace trustgate::protocol {

    enum class CliCommand {
        Run,   // drive a plan of tool calls through the gate
        Root   // print the allowlist key of a single command line
    };

    // Validated user input for one CLI invocation
    struct GateRequest {
        CliCommand command = CliCommand::Run;
        std::optional<std::string> command_line;
        std::optional<std::filesystem::path> plan_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> journal_dir;
        bool yolo = false;
        bool verbose = false;
    };

} // namespace trustgate::protocol
