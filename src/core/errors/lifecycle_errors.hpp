#pragma once
#include <string>
#include <variant>

namespace planloop::core::errors {

    // Where a failure originated. Validation findings are not errors, they
    // travel as protocol::Diagnostic values.
    enum class ErrorCategory {
        Input,      // Bad CLI flag, config file or request
        Registry,   // Tool registration conflict
        Parse,      // Planner output could not be turned into a plan payload
        Execution,  // A tool could not be invoked at all
        Deadline,   // A planner or executor deadline elapsed
        Lifecycle,  // The run itself gave up (attempt cap, broken planner)
        Internal    // pipes, fork, filesystem
    };

    struct LifecycleError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a LifecycleError.
    template <typename T>
    using Result = std::variant<T, LifecycleError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LifecycleError>(result);
    }

    template <typename T>
    const LifecycleError& get_error(const Result<T>& result) {
        return std::get<LifecycleError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Registry:  return "registry";
            case ErrorCategory::Parse:     return "parse";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Deadline:  return "deadline";
            case ErrorCategory::Lifecycle: return "lifecycle";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace planloop::core::errors
