#pragma once
#include <string>
#include <variant>

namespace hookguard::core::errors {

    // Typed error categories. A policy verdict is never an error; only
    // failures to evaluate one are.
    enum class ErrorCategory {
        Input,      // E.g., malformed invocation payload or CLI flag
        Execution,  // E.g., a formatter process could not be spawned
        Policy,     // E.g., a rule table could not be built from config
        Internal    // E.g., I/O failure inside the engine itself
    };

    struct HookError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a HookError.
    template <typename T>
    using Result = std::variant<T, HookError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<HookError>(result);
    }

    template <typename T>
    const HookError& get_error(const Result<T>& result) {
        return std::get<HookError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace hookguard::core::errors
