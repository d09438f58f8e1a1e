#include "policy/command_root.hpp"

#include <cctype>

namespace trustgate::policy {

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view value) {
    while (!value.empty() && is_space(value.front())) {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_space(value.back())) {
        value.remove_suffix(1);
    }
    return value;
}

std::string_view first_segment(std::string_view command) {
    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        if (c == ';' || c == '|') {
            return command.substr(0, i);
        }
        if (c == '&' && i + 1 < command.size() && command[i + 1] == '&') {
            return command.substr(0, i);
        }
    }
    return command;
}

std::string_view first_token(std::string_view segment) {
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (is_space(segment[i])) {
            return segment.substr(0, i);
        }
    }
    return segment;
}

std::string_view basename(std::string_view token) {
    const auto slash = token.find_last_of("/\\");
    if (slash == std::string_view::npos) {
        return token;
    }
    return token.substr(slash + 1);
}

}  // namespace

std::string extract_command_root(std::string_view command_line) {
    const std::string_view trimmed = trim(command_line);
    if (trimmed.empty()) {
        return "";
    }

    const std::string_view segment = trim(first_segment(trimmed));
    return std::string(basename(first_token(segment)));
}

}  // namespace trustgate::policy
