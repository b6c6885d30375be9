#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace agentloop::protocol {

// OpenAI-style role object, e.g. {"role":"tool","tool_call_id":..,"content":..}.
nlohmann::json message_to_json(const Message& message);

nlohmann::json history_to_json(const std::vector<Message>& messages);

// Function-tool object. The provider-private config is never serialized.
nlohmann::json descriptor_to_json(const ToolDescriptor& descriptor);

nlohmann::json options_to_json(const ChatOptions& options);

nlohmann::json request_to_json(const ChatRequest& request);

// Reads {"text":..,"tool_calls":[{"id","name","arguments"}],"reasoning":..}.
// "arguments" may be a JSON string or any JSON value (dumped verbatim).
core::errors::Result<ChatResponse> response_from_json(const nlohmann::json& payload);

}  // namespace agentloop::protocol
