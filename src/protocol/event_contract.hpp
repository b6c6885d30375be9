#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include "protocol/run_execution_contract.hpp"

namespace agentloop::protocol {

    // Lifecycle events emitted by ConversationEngine::run
    struct RunStartEvent { std::string run_id; };
    struct TurnStartEvent { std::uint32_t iteration = 0; };
    struct ReasoningEvent { std::string text; };
    struct ToolExecutionStartEvent { std::string call_id; std::string tool_name; };
    struct ToolExecutionEndEvent { std::string call_id; bool success = false; };
    struct RunEndEvent { StopReason reason; };

    using AgentEvent = std::variant<
        RunStartEvent,
        TurnStartEvent,
        ReasoningEvent,
        ToolExecutionStartEvent,
        ToolExecutionEndEvent,
        RunEndEvent
    >;

    using RunObserver = std::function<void(const AgentEvent&)>;

} // namespace agentloop::protocol
