#include "app/console_prompter.hpp"

#include <charconv>
#include <cstddef>
#include <system_error>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace trustgate::app {

using protocol::BridgedConfirmationDetails;
using protocol::ConfirmationOutcome;
using protocol::ShellConfirmationDetails;

namespace {

struct Option {
    std::string label;
    ConfirmationOutcome outcome;
};

std::vector<Option> options_for(const session::ConfirmationRequest& request) {
    if (const auto* shell = std::get_if<ShellConfirmationDetails>(&request.details())) {
        return {{"Yes, allow once", ConfirmationOutcome::ProceedOnce},
                {"Yes, allow always \"" + shell->root_command + " ...\"",
                 ConfirmationOutcome::ProceedAlways},
                {"No (cancel)", ConfirmationOutcome::Cancel}};
    }

    const auto& bridged = std::get<BridgedConfirmationDetails>(request.details());
    return {{"Yes, allow once", ConfirmationOutcome::ProceedOnce},
            {"Yes, always allow tool \"" + bridged.tool_id + "\" from server \"" +
                 bridged.server_id + "\"",
             ConfirmationOutcome::ProceedAlwaysTool},
            {"Yes, always allow all tools from server \"" + bridged.server_id + "\"",
             ConfirmationOutcome::ProceedAlwaysServer},
            {"No (cancel)", ConfirmationOutcome::Cancel}};
}

}  // namespace

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

ConfirmationOutcome ConsolePrompter::prompt(const session::ConfirmationRequest& request) {
    out_ << "\n" << request.title() << "\n";
    if (const auto* shell = std::get_if<ShellConfirmationDetails>(&request.details())) {
        out_ << "  " << shell->description << "\n";
    } else {
        const auto& bridged = std::get<BridgedConfirmationDetails>(request.details());
        out_ << "  Server: " << bridged.server_id << "\n"
             << "  Tool:   " << bridged.tool_id << "\n"
             << "  Args:   " << bridged.arguments_json << "\n";
    }

    const auto options = options_for(request);
    for (std::size_t i = 0; i < options.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << options[i].label << "\n";
    }
    out_ << "Choice: " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        return ConfirmationOutcome::Cancel;
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // Exception-free parsing; anything but a bare number cancels
    std::size_t choice = 0;
    const char* begin = line.data();
    const char* end = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(begin, end, choice);
    if (ec != std::errc() || ptr != end) {
        return ConfirmationOutcome::Cancel;
    }
    if (choice == 0 || choice > options.size()) {
        return ConfirmationOutcome::Cancel;
    }
    return options[choice - 1].outcome;
}

ReportingExecutor::ReportingExecutor(std::ostream& out) : out_(out) {}

core::errors::Result<protocol::ToolResult> ReportingExecutor::execute(
    const protocol::ToolDescriptor& tool, const nlohmann::json& params) {
    const std::string summary = tool.name + " " + params.dump();
    out_ << "-> would execute " << summary << "\n";
    return protocol::ToolResult{tool.name, true, summary, "", 0.0};
}

}  // namespace trustgate::app
