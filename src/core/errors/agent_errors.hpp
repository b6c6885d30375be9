#pragma once
#include <string>
#include <variant>
#include <utility>

namespace agentloop::core::errors {

    // Typed error categories. Only ToolExecution is recoverable inside a run;
    // every other category terminates the run and reaches the caller.
    enum class ErrorCategory {
        Input,              // E.g., invalid tool name, bad config value
        ToolNotFound,       // Requested tool is not resolvable in the registry
        ToolExecution,      // A resolved tool reported a failure
        Decode,             // Final answer could not be parsed into the target shape
        IterationExhausted, // Model kept calling tools until the turn bound
        UnexpectedResponse, // Backend answered with neither text nor tool calls
        Transport,          // Chat transport or remote tool session failed
        Internal            // C++ logic bug
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // A Result holds either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

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

    template <typename T>
    T&& take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline bool is_recoverable(const AgentError& error) {
        return error.category == ErrorCategory::ToolExecution;
    }

    // Shorthand for tool authors reporting a failure the model should see.
    inline AgentError tool_failure(std::string message,
                                   std::string code = "tool_failed") {
        return AgentError{ErrorCategory::ToolExecution, std::move(message),
                          std::move(code)};
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::ToolNotFound: return "tool_not_found";
            case ErrorCategory::ToolExecution: return "tool_execution";
            case ErrorCategory::Decode: return "decode";
            case ErrorCategory::IterationExhausted: return "iteration_exhausted";
            case ErrorCategory::UnexpectedResponse: return "unexpected_response";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace agentloop::core::errors
