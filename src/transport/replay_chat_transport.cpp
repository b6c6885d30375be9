#include "transport/replay_chat_transport.hpp"

#include <fstream>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/serialization.hpp"

namespace agentloop::transport {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ChatRequest;
using protocol::ChatResponse;

ReplayChatTransport::ReplayChatTransport(std::vector<ChatResponse> script) {
    for (auto& response : script) {
        script_.emplace_back(std::move(response));
    }
}

core::errors::Result<std::shared_ptr<ReplayChatTransport>> ReplayChatTransport::from_json(
    const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("responses") ||
        !document["responses"].is_array()) {
        return AgentError{ErrorCategory::Input,
                          "Replay script must be an object with a 'responses' array.",
                          "invalid_replay_script"};
    }

    auto transport = std::make_shared<ReplayChatTransport>();
    std::size_t index = 0;
    for (const auto& entry : document["responses"]) {
        auto parsed = protocol::response_from_json(entry);
        if (core::errors::is_error(parsed)) {
            const auto& err = core::errors::get_error(parsed);
            return AgentError{ErrorCategory::Input,
                              "Replay response " + std::to_string(index) + ": " + err.message,
                              "invalid_replay_script"};
        }
        transport->push(core::errors::get_value(parsed));
        ++index;
    }
    return transport;
}

core::errors::Result<std::shared_ptr<ReplayChatTransport>> ReplayChatTransport::from_file(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open replay script: " + path.string(),
                          "replay_script_not_found"};
    }
    const nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return AgentError{ErrorCategory::Input,
                          "Replay script is not valid JSON: " + path.string(),
                          "invalid_replay_script"};
    }
    return from_json(document);
}

void ReplayChatTransport::push(ChatResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.emplace_back(std::move(response));
}

void ReplayChatTransport::push_error(AgentError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.emplace_back(std::move(error));
}

core::errors::Result<ChatResponse> ReplayChatTransport::exec_chat(
    const ChatRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (core::logging::Logger::get().enabled(core::logging::LogLevel::TRACE)) {
        // Model text is not guaranteed to be UTF-8.
        LOG_TRACE("ReplayChatTransport: request " +
                  protocol::request_to_json(request).dump(
                      -1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    if (script_.empty()) {
        return AgentError{ErrorCategory::Transport,
                          "Replay script exhausted after " +
                              std::to_string(requests_.size() - 1) + " responses",
                          "replay_exhausted"};
    }
    auto next = std::move(script_.front());
    script_.pop_front();
    return next;
}

std::vector<ChatRequest> ReplayChatTransport::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t ReplayChatTransport::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::size_t ReplayChatTransport::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return script_.size();
}

}  // namespace agentloop::transport
