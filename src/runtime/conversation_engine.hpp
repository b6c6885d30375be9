#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/config/engine_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_request.hpp"
#include "runtime/response_coercer.hpp"
#include "tools/tool_provider.hpp"

namespace agentloop::runtime {

// What to do when the model asks for a tool nobody provides.
enum class UnresolvedToolPolicy {
    Fatal,  // abort the run with ToolNotFound
    Skip    // log and answer the call with the not-found message
};

constexpr std::uint32_t kDefaultMaxIterations = 5;

struct EngineSettings {
    std::uint32_t default_max_iterations = kDefaultMaxIterations;
    protocol::ChatOptions default_options = protocol::default_chat_options();
    UnresolvedToolPolicy unresolved_tool_policy = UnresolvedToolPolicy::Fatal;
};

EngineSettings settings_from_config(const core::config::EngineConfig& config);

// Drives the request / tool-dispatch loop against one chat transport.
//
// The conversation lives as long as the engine. Consecutive run() calls
// continue the same dialogue; nothing caps its growth, call clear_history()
// to start over. One engine must not run concurrently with itself; separate
// engines share nothing.
class ConversationEngine {
public:
    ConversationEngine(std::shared_ptr<protocol::ChatTransport> transport,
                       const std::string& system_prompt,
                       EngineSettings settings = {});

    // Runs until the model answers with text, decoded as T. std::string asks
    // for free text; any other T attaches JsonSchemaOf<T> as response format.
    template <typename T = std::string>
    core::errors::Result<protocol::RunOutcome<T>> run(
        const protocol::RunRequest& request,
        const tools::ToolProvider* tools = nullptr) {
        auto turn = run_turns(request, tools, ResponseCoercer::format_for<T>());
        if (core::errors::is_error(turn)) {
            return core::errors::get_error(turn);
        }
        const auto& answer = core::errors::get_value(turn);

        auto decoded = ResponseCoercer::decode<T>(answer.text);
        if (core::errors::is_error(decoded)) {
            return fail(core::errors::get_error(decoded));
        }

        emit(protocol::RunEndEvent{protocol::StopReason::Answered});
        return protocol::RunOutcome<T>{
            core::errors::take_value(std::move(decoded)), answer.iteration};
    }

    const std::vector<protocol::Message>& history() const { return history_; }

    // Keeps the system message, drops the rest.
    void clear_history();

    // Replaces the system message and drops the rest.
    void reset(const std::string& system_prompt);

    void set_observer(protocol::RunObserver observer) { observer_ = std::move(observer); }

    const EngineSettings& settings() const { return settings_; }

private:
    struct TerminalText {
        std::string text;
        std::uint32_t iteration = 0;
    };

    core::errors::Result<TerminalText> run_turns(
        const protocol::RunRequest& request, const tools::ToolProvider* tools,
        std::optional<protocol::ResponseFormat> response_format);

    // Appends one result per call; returns the error that must end the run.
    std::optional<core::errors::AgentError> dispatch_tool_calls(
        const std::vector<protocol::ToolCall>& calls, const tools::ToolProvider* tools);

    // Answers calls[from] with the error and the calls after it as not run.
    void answer_remaining(const std::vector<protocol::ToolCall>& calls, std::size_t from,
                          const core::errors::AgentError& error);

    core::errors::AgentError fail(const core::errors::AgentError& error) const;
    void emit(const protocol::AgentEvent& event) const;
    std::string log_tag() const;

    std::shared_ptr<protocol::ChatTransport> transport_;
    EngineSettings settings_;
    std::vector<protocol::Message> history_;
    protocol::RunObserver observer_;
    std::string run_id_;
};

}  // namespace agentloop::runtime
