#pragma once
#include <string>
#include <variant>

namespace conductor::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,           // E.g., an invalid CLI flag or environment value
        Validation,      // E.g., max_tokens outside its bounds
        Template,        // E.g., a config template is missing or malformed
        UnsupportedTool, // E.g., the registry has no adapter for the tool id
        Initialization,  // E.g., adapter lifecycle hook rejected the container
        Process,         // E.g., the agent CLI could not be spawned or exited non-zero
        Delivery,        // E.g., the companion endpoint refused the message
        Persistence,     // E.g., progress record could not be written
        Internal         // E.g., C++ logic bug or parsing failure
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either T or an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    // Operations with no payload return Result<Unit>.
    struct Unit {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:           return "input";
            case ErrorCategory::Validation:      return "validation";
            case ErrorCategory::Template:        return "template";
            case ErrorCategory::UnsupportedTool: return "unsupported_tool";
            case ErrorCategory::Initialization:  return "initialization";
            case ErrorCategory::Process:         return "process";
            case ErrorCategory::Delivery:        return "delivery";
            case ErrorCategory::Persistence:     return "persistence";
            case ErrorCategory::Internal:        return "internal";
        }
        return "unknown";
    }

    // First line of the message, capped at 200 characters. Used when a
    // failure is handed to an escalation channel.
    inline std::string compact_cause(const AgentError& error) {
        constexpr std::size_t kMaxCause = 200;
        std::string cause = error.message.substr(0, error.message.find('\n'));
        if (cause.size() > kMaxCause) {
            cause = cause.substr(0, kMaxCause - 3) + "...";
        }
        return cause;
    }

} // namespace conductor::core::errors
