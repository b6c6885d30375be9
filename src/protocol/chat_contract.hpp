#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace agentloop::protocol {

struct ResponseFormat {
    std::string name = "ResponseFormat";
    nlohmann::json schema;
};

struct ChatOptions {
    std::optional<double> temperature;
    std::optional<std::uint32_t> max_tokens;
    std::optional<double> top_p;
    std::optional<ResponseFormat> response_format;
};

constexpr double kDefaultTemperature = 0.2;

inline ChatOptions default_chat_options() {
    ChatOptions options;
    options.temperature = kDefaultTemperature;
    return options;
}

struct ChatRequest {
    std::string model;
    std::vector<Message> messages;
    std::vector<ToolDescriptor> tools;
    ChatOptions options;
};

// A backend answer: text XOR one-or-more tool calls, plus optional reasoning.
struct ChatResponse {
    std::optional<std::string> text;
    std::vector<ToolCall> tool_calls;
    std::optional<std::string> reasoning;
};

// The chat-completion backend. Implementations own the wire protocol,
// endpoints and credentials; failures must use ErrorCategory::Transport.
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    virtual core::errors::Result<ChatResponse> exec_chat(
        const ChatRequest& request) = 0;
};

}  // namespace agentloop::protocol
