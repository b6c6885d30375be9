#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/chat_contract.hpp"

namespace agentloop::transport {

// Answers exec_chat from a fixed script of responses and records every
// request it was given. Running past the end of the script is a Transport
// error.
class ReplayChatTransport : public protocol::ChatTransport {
public:
    ReplayChatTransport() = default;
    explicit ReplayChatTransport(std::vector<protocol::ChatResponse> script);

    // {"responses": [ {"text": ...} | {"tool_calls": [...]} , ... ]}
    static core::errors::Result<std::shared_ptr<ReplayChatTransport>> from_json(
        const nlohmann::json& document);

    static core::errors::Result<std::shared_ptr<ReplayChatTransport>> from_file(
        const std::filesystem::path& path);

    void push(protocol::ChatResponse response);
    void push_error(core::errors::AgentError error);

    core::errors::Result<protocol::ChatResponse> exec_chat(
        const protocol::ChatRequest& request) override;

    std::vector<protocol::ChatRequest> requests() const;
    std::size_t request_count() const;
    std::size_t remaining() const;

private:
    mutable std::mutex mutex_;
    std::deque<core::errors::Result<protocol::ChatResponse>> script_;
    std::vector<protocol::ChatRequest> requests_;
};

}  // namespace agentloop::transport
