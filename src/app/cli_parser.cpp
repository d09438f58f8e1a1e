#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace trustgate::app::cli {

    using namespace trustgate::core::errors;
    using trustgate::protocol::CliCommand;
    using trustgate::protocol::GateRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> command_line;
        std::optional<std::string> plan_file;
        std::optional<std::string> config_file;
        std::optional<std::string> journal_dir;
        bool yolo = false;
        bool verbose = false;
    };

    namespace {

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return GateError{ErrorCategory::Input, flag + " does not exist or is not a file: " + raw, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<GateRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No command provided.", "missing_command",
                             "Usage: trustgate run --plan-file calls.json | trustgate root --command \"...\""};
        }

        const std::string command = argv[1];
        GateRequest req;
        if (command == "run") {
            req.command = CliCommand::Run;
        } else if (command == "root") {
            req.command = CliCommand::Root;
        } else {
            return GateError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                             "Supported commands are 'run' and 'root'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--command") {
                if (i + 1 < args.size()) raw.command_line = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --command", "missing_value"};
            } else if (args[i] == "--plan-file") {
                if (i + 1 < args.size()) raw.plan_file = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --plan-file", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_file = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--journal-dir") {
                if (i + 1 < args.size()) raw.journal_dir = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --journal-dir", "missing_value"};
            } else if (args[i] == "--yolo") {
                raw.yolo = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return GateError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce per-command requirements
        req.yolo = raw.yolo;
        req.verbose = raw.verbose;

        if (req.command == CliCommand::Root) {
            if (!raw.command_line.has_value()) {
                return GateError{ErrorCategory::Input, "'root' requires --command", "missing_required_flag"};
            }
            if (raw.plan_file.has_value()) {
                return GateError{ErrorCategory::Input, "'root' does not take --plan-file", "conflicting_flags"};
            }
            req.command_line = raw.command_line.value();
            return req;
        }

        if (!raw.plan_file.has_value()) {
            return GateError{ErrorCategory::Input, "'run' requires --plan-file", "missing_required_flag"};
        }
        if (raw.command_line.has_value()) {
            return GateError{ErrorCategory::Input, "'run' does not take --command", "conflicting_flags"};
        }

        auto plan = existing_file(raw.plan_file.value(), "--plan-file");
        if (is_error(plan)) {
            return get_error(plan);
        }
        req.plan_file = get_value(plan);

        if (raw.config_file) {
            auto config = existing_file(raw.config_file.value(), "--config");
            if (is_error(config)) {
                return get_error(config);
            }
            req.config_file = get_value(config);
        }

        if (raw.journal_dir) {
            std::filesystem::path dir(raw.journal_dir.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(dir, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(dir, path_ec)) {
                return GateError{ErrorCategory::Input, "--journal-dir is not a directory", "invalid_path"};
            }
            req.journal_dir = std::move(dir);
        }

        return req;
    }

} // namespace trustgate::app::cli
