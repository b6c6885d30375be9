#include "runtime/conversation_engine.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"

namespace agentloop::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::AssistantMessage;
using protocol::ChatRequest;
using protocol::ChatResponse;
using protocol::StopReason;
using protocol::SystemMessage;
using protocol::ToolCall;
using protocol::ToolCallRequestMessage;
using protocol::ToolCallResultMessage;
using protocol::UserMessage;

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

StopReason stop_reason_for(const AgentError& error) {
    switch (error.category) {
        case ErrorCategory::ToolNotFound:
            return StopReason::ToolNotFound;
        case ErrorCategory::Decode:
            return StopReason::DecodeFailed;
        case ErrorCategory::IterationExhausted:
            return StopReason::IterationExhausted;
        case ErrorCategory::UnexpectedResponse:
            return StopReason::UnexpectedResponse;
        case ErrorCategory::Transport:
            return StopReason::TransportFailed;
        default:
            return StopReason::ToolFailure;
    }
}

// Backends send "" for tools without parameters.
nlohmann::json parse_arguments(const std::string& raw) {
    if (trim(raw).empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(raw, nullptr, false);
}

}  // namespace

EngineSettings settings_from_config(const core::config::EngineConfig& config) {
    EngineSettings settings;
    settings.default_max_iterations = config.max_iterations;
    settings.default_options.temperature = config.temperature;
    settings.default_options.max_tokens = config.max_tokens;
    settings.default_options.top_p = config.top_p;
    settings.unresolved_tool_policy = config.skip_unresolved_tools
                                          ? UnresolvedToolPolicy::Skip
                                          : UnresolvedToolPolicy::Fatal;
    return settings;
}

ConversationEngine::ConversationEngine(
    std::shared_ptr<protocol::ChatTransport> transport,
    const std::string& system_prompt, EngineSettings settings)
    : transport_(std::move(transport)), settings_(std::move(settings)) {
    history_.emplace_back(SystemMessage{trim(system_prompt)});
}

void ConversationEngine::clear_history() {
    history_.erase(history_.begin() + 1, history_.end());
}

void ConversationEngine::reset(const std::string& system_prompt) {
    history_.clear();
    history_.emplace_back(SystemMessage{trim(system_prompt)});
}

void ConversationEngine::emit(const protocol::AgentEvent& event) const {
    if (observer_) {
        observer_(event);
    }
}

std::string ConversationEngine::log_tag() const {
    return "ConversationEngine: run " + run_id_ + ": ";
}

AgentError ConversationEngine::fail(const AgentError& error) const {
    LOG_ERROR(log_tag() + "failed [" + error.code + "]: " + error.message);
    emit(protocol::RunEndEvent{stop_reason_for(error)});
    return error;
}

core::errors::Result<ConversationEngine::TerminalText> ConversationEngine::run_turns(
    const protocol::RunRequest& request, const tools::ToolProvider* tools,
    std::optional<protocol::ResponseFormat> response_format) {
    if (!transport_) {
        return AgentError{ErrorCategory::Input, "Chat transport is null.",
                          "missing_transport"};
    }
    const std::uint32_t max_iterations =
        request.max_iterations.value_or(settings_.default_max_iterations);
    if (max_iterations == 0) {
        return AgentError{ErrorCategory::Input,
                          "max_iterations must be greater than zero.",
                          "invalid_iteration_bound"};
    }

    run_id_ = core::config::generate_run_id();
    emit(protocol::RunStartEvent{run_id_});
    LOG_DEBUG(log_tag() + "question: " + request.prompt);

    ChatRequest chat_request;
    chat_request.model = request.model;
    chat_request.options = request.options.value_or(settings_.default_options);
    if (response_format.has_value()) {
        chat_request.options.response_format = std::move(response_format);
    }
    if (tools != nullptr) {
        auto listed = tools->list_tools();
        if (core::errors::is_error(listed)) {
            return fail(core::errors::get_error(listed));
        }
        chat_request.tools = core::errors::get_value(listed);
    }

    history_.emplace_back(UserMessage{request.prompt});

    for (std::uint32_t iteration = 0; iteration < max_iterations; ++iteration) {
        LOG_DEBUG(log_tag() + "iteration " + std::to_string(iteration));
        emit(protocol::TurnStartEvent{iteration});

        chat_request.messages = history_;
        auto exchanged = transport_->exec_chat(chat_request);
        if (core::errors::is_error(exchanged)) {
            return fail(core::errors::get_error(exchanged));
        }
        const ChatResponse& response = core::errors::get_value(exchanged);

        if (response.reasoning.has_value()) {
            LOG_DEBUG(log_tag() + "reasoning: " + response.reasoning.value());
            emit(protocol::ReasoningEvent{response.reasoning.value()});
        }

        if (!response.tool_calls.empty()) {
            // Preamble text next to tool calls is replayed, never decoded.
            if (response.text.has_value() && !response.text->empty()) {
                history_.emplace_back(AssistantMessage{response.text.value()});
            }
            history_.emplace_back(ToolCallRequestMessage{response.tool_calls});

            auto fatal = dispatch_tool_calls(response.tool_calls, tools);
            if (fatal.has_value()) {
                return fail(fatal.value());
            }
            continue;
        }

        if (response.text.has_value()) {
            LOG_DEBUG(log_tag() + "answer: " + response.text.value());
            history_.emplace_back(AssistantMessage{response.text.value()});
            return TerminalText{response.text.value(), iteration};
        }

        return fail(AgentError{ErrorCategory::UnexpectedResponse,
                               "Unsupported message content: response has neither "
                               "text nor tool calls",
                               "unsupported_response"});
    }

    return fail(AgentError{ErrorCategory::IterationExhausted,
                           "Unable to get response in " +
                               std::to_string(max_iterations) + " tries",
                           "iteration_exhausted",
                           "Raise max_iterations or check the tools the model keeps calling."});
}

void ConversationEngine::answer_remaining(const std::vector<ToolCall>& calls,
                                          std::size_t from, const AgentError& error) {
    history_.emplace_back(ToolCallResultMessage{calls[from].id, error.message});
    for (std::size_t i = from + 1; i < calls.size(); ++i) {
        history_.emplace_back(
            ToolCallResultMessage{calls[i].id, "Not executed: " + error.message});
    }
}

std::optional<AgentError> ConversationEngine::dispatch_tool_calls(
    const std::vector<ToolCall>& calls, const tools::ToolProvider* tools) {
    const bool skip_unresolved =
        settings_.unresolved_tool_policy == UnresolvedToolPolicy::Skip;

    for (std::size_t index = 0; index < calls.size(); ++index) {
        const ToolCall& call = calls[index];
        LOG_TRACE(log_tag() + "tool request: " + call.name +
                  " with arguments: " + call.arguments);
        emit(protocol::ToolExecutionStartEvent{call.id, call.name});

        core::errors::Result<std::string> outcome =
            AgentError{ErrorCategory::ToolNotFound,
                       "No tool found for " + call.name +
                           ": no tool provider was given to this run",
                       "tool_not_found"};
        if (tools != nullptr) {
            const nlohmann::json arguments = parse_arguments(call.arguments);
            if (arguments.is_discarded()) {
                LOG_WARN(log_tag() + "malformed arguments for " + call.name);
                history_.emplace_back(ToolCallResultMessage{
                    call.id, "Invalid tool arguments (not valid JSON): " + call.arguments});
                emit(protocol::ToolExecutionEndEvent{call.id, false});
                continue;
            }
            outcome = tools->invoke(call.name, arguments);
        }

        if (!core::errors::is_error(outcome)) {
            const std::string& text = core::errors::get_value(outcome);
            LOG_TRACE(log_tag() + "tool result: " + text);
            history_.emplace_back(ToolCallResultMessage{call.id, text});
            emit(protocol::ToolExecutionEndEvent{call.id, true});
            continue;
        }

        const AgentError& error = core::errors::get_error(outcome);
        emit(protocol::ToolExecutionEndEvent{call.id, false});

        // The model gets the failure as the tool's answer and may react.
        if (core::errors::is_recoverable(error)) {
            LOG_WARN(log_tag() + "tool " + call.name + " failed: " + error.message);
            history_.emplace_back(ToolCallResultMessage{call.id, error.message});
            continue;
        }
        if (error.category == ErrorCategory::ToolNotFound && skip_unresolved) {
            LOG_WARN(log_tag() + "skipping call " + call.id + ": " + error.message);
            history_.emplace_back(ToolCallResultMessage{call.id, error.message});
            continue;
        }

        // Every call id keeps a result so the history stays replayable.
        answer_remaining(calls, index, error);
        return error;
    }
    return std::nullopt;
}

}  // namespace agentloop::runtime
