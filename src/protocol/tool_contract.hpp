#pragma once
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentloop::protocol {

    // How the LLM asks for a tool to be executed
    struct ToolCall {
        std::string id;         // backend-issued correlation token
        std::string name;       // public tool name, e.g. "0-get_current_time"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // What a tool provider advertises to the model
    struct ToolDescriptor {
        std::string name;
        std::optional<std::string> description;
        std::optional<nlohmann::json> schema;   // JSON Schema of accepted arguments
        std::optional<nlohmann::json> config;   // provider-private, never sent
    };

    constexpr std::size_t kMaxToolNameLength = 64;

    // Conservative grammar accepted by every chat backend we target.
    inline bool is_valid_tool_name(const std::string& name) {
        if (name.empty() || name.size() > kMaxToolNameLength) {
            return false;
        }
        for (const char c : name) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) == 0 && c != '_' && c != '-') {
                return false;
            }
        }
        return true;
    }

} // namespace agentloop::protocol
