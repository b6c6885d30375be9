#pragma once

#include <cstdint>
#include <string>

namespace agentloop::protocol {

enum class StopReason {
    Answered,           // terminal text decoded
    ToolNotFound,
    ToolFailure,        // non-recoverable provider error
    DecodeFailed,
    IterationExhausted,
    UnexpectedResponse,
    TransportFailed
};

// Decoded answer plus the zero-based iteration that produced it.
template <typename T>
struct RunOutcome {
    T value;
    std::uint32_t iteration = 0;
};

inline std::string to_string(const StopReason reason) {
    switch (reason) {
        case StopReason::Answered:
            return "answered";
        case StopReason::ToolNotFound:
            return "tool_not_found";
        case StopReason::ToolFailure:
            return "tool_failure";
        case StopReason::DecodeFailed:
            return "decode_failed";
        case StopReason::IterationExhausted:
            return "iteration_exhausted";
        case StopReason::UnexpectedResponse:
            return "unexpected_response";
        case StopReason::TransportFailed:
            return "transport_failed";
        default:
            return "unknown";
    }
}

}  // namespace agentloop::protocol
