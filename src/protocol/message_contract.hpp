#pragma once
#include <string>
#include <variant>
#include <vector>
#include "tool_contract.hpp"

namespace agentloop::protocol {

    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    struct SystemMessage { std::string text; };
    struct UserMessage { std::string text; };
    struct AssistantMessage { std::string text; };

    // Every tool request the model emitted in one turn, in emission order.
    struct ToolCallRequestMessage { std::vector<ToolCall> calls; };

    // The answer to one ToolCall, paired by call id.
    struct ToolCallResultMessage {
        std::string call_id;
        std::string text;
    };

    using Message = std::variant<
        SystemMessage,
        UserMessage,
        AssistantMessage,
        ToolCallRequestMessage,
        ToolCallResultMessage
    >;

    // A tool-call request is sent by the assistant; its results by the tool role.
    inline Role role_of(const Message& message) {
        switch (message.index()) {
            case 0: return Role::System;
            case 1: return Role::User;
            case 2:
            case 3: return Role::Assistant;
            default: return Role::Tool;
        }
    }

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
            case Role::Tool: return "tool";
            default: return "unknown";
        }
    }

} // namespace agentloop::protocol
