#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "protocol/chat_contract.hpp"

namespace agentloop::protocol {

    // One call to ConversationEngine::run
    struct RunRequest {
        std::string model;
        std::string prompt;
        std::optional<std::uint32_t> max_iterations; // engine default when absent
        std::optional<ChatOptions> options;          // engine default when absent
    };

} // namespace agentloop::protocol
