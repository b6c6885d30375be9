#include "protocol/serialization.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace agentloop::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json tool_call_to_json(const ToolCall& call) {
    json payload;
    payload["id"] = call.id;
    payload["type"] = "function";
    payload["function"] = {{"name", call.name}, {"arguments", call.arguments}};
    return payload;
}

AgentError invalid_response(const std::string& message) {
    return AgentError{ErrorCategory::Transport, message, "invalid_response_payload"};
}

}  // namespace

json message_to_json(const Message& message) {
    return std::visit(
        [](const auto& m) -> json {
            using T = std::decay_t<decltype(m)>;
            json payload;
            if constexpr (std::is_same_v<T, SystemMessage>) {
                payload["role"] = "system";
                payload["content"] = m.text;
            } else if constexpr (std::is_same_v<T, UserMessage>) {
                payload["role"] = "user";
                payload["content"] = m.text;
            } else if constexpr (std::is_same_v<T, AssistantMessage>) {
                payload["role"] = "assistant";
                payload["content"] = m.text;
            } else if constexpr (std::is_same_v<T, ToolCallRequestMessage>) {
                payload["role"] = "assistant";
                payload["content"] = nullptr;
                payload["tool_calls"] = json::array();
                for (const auto& call : m.calls) {
                    payload["tool_calls"].push_back(tool_call_to_json(call));
                }
            } else {
                payload["role"] = "tool";
                payload["tool_call_id"] = m.call_id;
                payload["content"] = m.text;
            }
            return payload;
        },
        message);
}

json history_to_json(const std::vector<Message>& messages) {
    json out = json::array();
    for (const auto& message : messages) {
        out.push_back(message_to_json(message));
    }
    return out;
}

json descriptor_to_json(const ToolDescriptor& descriptor) {
    json function;
    function["name"] = descriptor.name;
    if (descriptor.description.has_value()) {
        function["description"] = descriptor.description.value();
    }
    if (descriptor.schema.has_value()) {
        function["parameters"] = descriptor.schema.value();
    }
    return json{{"type", "function"}, {"function", function}};
}

json options_to_json(const ChatOptions& options) {
    json payload = json::object();
    if (options.temperature.has_value()) {
        payload["temperature"] = options.temperature.value();
    }
    if (options.max_tokens.has_value()) {
        payload["max_tokens"] = options.max_tokens.value();
    }
    if (options.top_p.has_value()) {
        payload["top_p"] = options.top_p.value();
    }
    if (options.response_format.has_value()) {
        const auto& format = options.response_format.value();
        payload["response_format"] = {
            {"type", "json_schema"},
            {"json_schema", {{"name", format.name}, {"schema", format.schema}}}};
    }
    return payload;
}

json request_to_json(const ChatRequest& request) {
    json payload = options_to_json(request.options);
    payload["model"] = request.model;
    payload["messages"] = history_to_json(request.messages);
    if (!request.tools.empty()) {
        payload["tools"] = json::array();
        for (const auto& tool : request.tools) {
            payload["tools"].push_back(descriptor_to_json(tool));
        }
    }
    return payload;
}

core::errors::Result<ChatResponse> response_from_json(const json& payload) {
    if (!payload.is_object()) {
        return invalid_response("Chat response must be a JSON object.");
    }

    ChatResponse response;
    if (payload.contains("text") && !payload["text"].is_null()) {
        if (!payload["text"].is_string()) {
            return invalid_response("Chat response field 'text' must be a string.");
        }
        response.text = payload["text"].get<std::string>();
    }
    if (payload.contains("reasoning") && !payload["reasoning"].is_null()) {
        if (!payload["reasoning"].is_string()) {
            return invalid_response("Chat response field 'reasoning' must be a string.");
        }
        response.reasoning = payload["reasoning"].get<std::string>();
    }

    if (payload.contains("tool_calls")) {
        const auto& calls = payload["tool_calls"];
        if (!calls.is_array()) {
            return invalid_response("Chat response field 'tool_calls' must be an array.");
        }
        for (const auto& entry : calls) {
            if (!entry.is_object() || !entry.contains("id") || !entry.contains("name") ||
                !entry["id"].is_string() || !entry["name"].is_string()) {
                return invalid_response("Each tool call needs string 'id' and 'name'.");
            }
            ToolCall call;
            call.id = entry["id"].get<std::string>();
            call.name = entry["name"].get<std::string>();
            if (!entry.contains("arguments") || entry["arguments"].is_null()) {
                call.arguments = "{}";
            } else if (entry["arguments"].is_string()) {
                call.arguments = entry["arguments"].get<std::string>();
            } else {
                call.arguments = entry["arguments"].dump();
            }
            response.tool_calls.push_back(std::move(call));
        }
    }
    return response;
}

}  // namespace agentloop::protocol
