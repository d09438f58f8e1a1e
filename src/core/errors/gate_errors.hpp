#pragma once
#include <string>
#include <variant>

namespace trustgate::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,       // E.g., unknown CLI flag, unknown invocation id
        Validation,  // E.g., empty command text, unusable command root
        Policy,      // E.g., a tool the session refuses to run
        Internal     // E.g., double resolution, journal I/O failure
    };

    // The standardized error payload
    struct GateError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy
    // A Result holds either a successful value of type T, OR a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Policy:     return "policy";
            case ErrorCategory::Internal:   return "internal";
            default:                        return "unknown";
        }
    }

} // namespace trustgate::core::errors
