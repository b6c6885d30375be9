#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/conversation_engine.hpp"
#include "tools/tool_registry.hpp"
#include "transport/replay_chat_transport.hpp"

namespace {

using agentloop::core::errors::AgentError;
using agentloop::core::errors::ErrorCategory;
using agentloop::core::errors::get_error;
using agentloop::core::errors::get_value;
using agentloop::core::errors::is_error;
using agentloop::core::errors::Result;
using agentloop::core::errors::tool_failure;
using agentloop::runtime::ConversationEngine;
using agentloop::runtime::EngineSettings;
using agentloop::runtime::UnresolvedToolPolicy;
using agentloop::transport::ReplayChatTransport;
using namespace agentloop::protocol;
using nlohmann::json;

ChatResponse text(const std::string& body) {
    ChatResponse response;
    response.text = body;
    return response;
}

ChatResponse calls(std::vector<ToolCall> requested) {
    ChatResponse response;
    response.tool_calls = std::move(requested);
    return response;
}

RunRequest ask(const std::string& prompt, std::optional<std::uint32_t> max_iterations = std::nullopt) {
    RunRequest request;
    request.model = "test-model";
    request.prompt = prompt;
    request.max_iterations = max_iterations;
    return request;
}

// Registry with 0-echo (returns "text"), 0-fail (recoverable failure) and
// 0-crash (fatal internal error).
agentloop::tools::ToolRegistry make_tools() {
    auto provider = std::make_shared<agentloop::tools::FunctionToolProvider>();
    EXPECT_FALSE(is_error(provider->add("echo", std::nullopt, std::nullopt,
                                        [](const json& args) -> Result<std::string> {
                                            return args.at("text").get<std::string>();
                                        })));
    EXPECT_FALSE(is_error(provider->add("fail", std::nullopt, std::nullopt,
                                        [](const json&) -> Result<std::string> {
                                            return tool_failure("backend unreachable");
                                        })));
    EXPECT_FALSE(is_error(provider->add("crash", std::nullopt, std::nullopt,
                                        [](const json&) -> Result<std::string> {
                                            return AgentError{ErrorCategory::Internal,
                                                              "corrupted state", "internal"};
                                        })));
    auto built = agentloop::tools::make_registry({provider});
    EXPECT_FALSE(is_error(built));
    return get_value(built);
}

template <typename M>
const M& as(const Message& message) {
    return std::get<M>(message);
}

class ConversationEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<ReplayChatTransport> transport = std::make_shared<ReplayChatTransport>();
    agentloop::tools::ToolRegistry tools = make_tools();
};

TEST_F(ConversationEngineTest, DirectAnswerIsIterationZero) {
    transport->push(text("Paris"));
    ConversationEngine engine(transport, "You are a geography expert.");

    auto result = engine.run(ask("Capital of France?"), &tools);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).value, "Paris");
    EXPECT_EQ(get_value(result).iteration, 0u);
    EXPECT_EQ(transport->request_count(), 1u);
}

TEST_F(ConversationEngineTest, RecordsToolRoundTripInOrder) {
    transport->push(calls({ToolCall{"c1", "0-echo", R"({"text":"pong"})"}}));
    transport->push(text("done"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("ping"), &tools);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).iteration, 1u);

    const auto& history = engine.history();
    ASSERT_EQ(history.size(), 5u);
    EXPECT_EQ(as<SystemMessage>(history[0]).text, "sys");
    EXPECT_EQ(as<UserMessage>(history[1]).text, "ping");
    ASSERT_EQ(as<ToolCallRequestMessage>(history[2]).calls.size(), 1u);
    EXPECT_EQ(as<ToolCallRequestMessage>(history[2]).calls[0].name, "0-echo");
    EXPECT_EQ(as<ToolCallResultMessage>(history[3]).call_id, "c1");
    EXPECT_EQ(as<ToolCallResultMessage>(history[3]).text, "pong");
    EXPECT_EQ(as<AssistantMessage>(history[4]).text, "done");

    // The second request carries the tool exchange.
    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].messages.size(), 4u);
}

TEST_F(ConversationEngineTest, MultipleCallsAreAnsweredInEmissionOrder) {
    transport->push(calls({ToolCall{"a", "0-echo", R"({"text":"first"})"},
                           ToolCall{"b", "0-echo", R"({"text":"second"})"}}));
    transport->push(text("ok"));
    ConversationEngine engine(transport, "sys");

    ASSERT_FALSE(is_error(engine.run(ask("go"), &tools)));
    const auto& history = engine.history();
    ASSERT_EQ(history.size(), 6u);
    EXPECT_EQ(as<ToolCallResultMessage>(history[3]).call_id, "a");
    EXPECT_EQ(as<ToolCallResultMessage>(history[4]).call_id, "b");
}

TEST_F(ConversationEngineTest, UnknownToolIsFatal) {
    transport->push(calls({ToolCall{"c1", "0-teleport", "{}"}}));
    transport->push(text("never used"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::ToolNotFound);
    EXPECT_EQ(transport->request_count(), 1u);

    // The unanswered call is closed with the failure.
    EXPECT_EQ(as<ToolCallResultMessage>(engine.history().back()).call_id, "c1");

    auto next = engine.run(ask("try again"), &tools);
    ASSERT_FALSE(is_error(next));
    const auto replayed = transport->requests()[1];
    ASSERT_EQ(replayed.messages.size(), 5u);
    EXPECT_EQ(as<ToolCallResultMessage>(replayed.messages[3]).call_id, "c1");
}

TEST_F(ConversationEngineTest, ToolCallWithoutProviderIsFatal) {
    transport->push(calls({ToolCall{"c1", "0-echo", "{}"}}));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::ToolNotFound);
}

TEST_F(ConversationEngineTest, SkipPolicyAnswersUnknownCallsAndContinues) {
    transport->push(calls({ToolCall{"c1", "0-teleport", "{}"}}));
    transport->push(text("fine"));
    EngineSettings settings;
    settings.unresolved_tool_policy = UnresolvedToolPolicy::Skip;
    ConversationEngine engine(transport, "sys", settings);

    auto result = engine.run(ask("go"), &tools);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).value, "fine");

    const auto& skipped = as<ToolCallResultMessage>(engine.history()[3]);
    EXPECT_EQ(skipped.call_id, "c1");
    EXPECT_NE(skipped.text.find("not found"), std::string::npos);
}

TEST_F(ConversationEngineTest, FatalToolErrorLeavesEveryCallAnswered) {
    transport->push(calls({ToolCall{"c1", "0-teleport", "{}"},
                           ToolCall{"c2", "0-echo", R"({"text":"late"})"}}));
    transport->push(text("hello again"));
    ConversationEngine engine(transport, "sys");

    ASSERT_TRUE(is_error(engine.run(ask("go"), &tools)));
    ASSERT_FALSE(is_error(engine.run(ask("again"), &tools)));

    // The second request replays the aborted turn with both calls paired.
    const auto second = transport->requests()[1];
    ASSERT_EQ(second.messages.size(), 6u);
    EXPECT_TRUE(std::holds_alternative<ToolCallRequestMessage>(second.messages[2]));
    EXPECT_EQ(as<ToolCallResultMessage>(second.messages[3]).call_id, "c1");
    EXPECT_EQ(as<ToolCallResultMessage>(second.messages[4]).call_id, "c2");
    EXPECT_EQ(as<ToolCallResultMessage>(second.messages[4]).text.rfind("Not executed", 0), 0u);
    EXPECT_EQ(as<UserMessage>(second.messages[5]).text, "again");
}

TEST_F(ConversationEngineTest, TextThatIsNotUtf8IsReturnedVerbatim) {
    transport->push(text("caf\xe9"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("coffee?"), &tools);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).value, "caf\xe9");
}

TEST_F(ConversationEngineTest, EveryEngineLogLineCarriesTheRunId) {
    std::ostringstream captured;
    auto& logger = agentloop::core::logging::Logger::get();
    const auto previous = logger.level();
    logger.set_sink(captured);
    logger.set_level(agentloop::core::logging::LogLevel::TRACE);

    transport->push(calls({ToolCall{"c1", "0-fail", "{}"}}));
    transport->push(text("done"));
    ConversationEngine engine(transport, "sys");
    std::string run_id;
    engine.set_observer([&run_id](const AgentEvent& event) {
        if (const auto* start = std::get_if<RunStartEvent>(&event)) {
            run_id = start->run_id;
        }
    });
    const bool failed = is_error(engine.run(ask("go"), &tools));

    logger.reset_sink();
    logger.set_level(previous);
    ASSERT_FALSE(failed);
    ASSERT_FALSE(run_id.empty());

    std::istringstream lines(captured.str());
    std::string line;
    int engine_lines = 0;
    while (std::getline(lines, line)) {
        if (line.find("ConversationEngine") == std::string::npos) {
            continue;
        }
        ++engine_lines;
        EXPECT_NE(line.find("run " + run_id), std::string::npos) << line;
    }
    EXPECT_GE(engine_lines, 5);
}

TEST_F(ConversationEngineTest, StopsAfterExactlyMaxIterationsRequests) {
    for (int i = 0; i < 5; ++i) {
        transport->push(calls({ToolCall{"c" + std::to_string(i), "0-echo", R"({"text":"again"})"}}));
    }
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("loop", 2), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::IterationExhausted);
    EXPECT_EQ(get_error(result).message, "Unable to get response in 2 tries");
    EXPECT_EQ(transport->request_count(), 2u);
}

TEST_F(ConversationEngineTest, UsesDefaultIterationBound) {
    for (int i = 0; i < 10; ++i) {
        transport->push(calls({ToolCall{"c", "0-echo", R"({"text":"again"})"}}));
    }
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("loop"), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(transport->request_count(), 5u);
}

TEST_F(ConversationEngineTest, ZeroIterationBoundIsInputError) {
    ConversationEngine engine(transport, "sys");
    auto result = engine.run(ask("go", 0), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(transport->request_count(), 0u);
}

TEST_F(ConversationEngineTest, DecodesTypedAnswerWithStrippedSchema) {
    transport->push(text("42"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run<int>(ask("What is 6*7?", 1));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).value, 42);
    EXPECT_EQ(get_value(result).iteration, 0u);

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_TRUE(requests[0].options.response_format.has_value());
    const json& schema = requests[0].options.response_format->schema;
    EXPECT_EQ(schema, (json{{"type", "integer"}}));
    EXPECT_FALSE(schema.contains("$schema"));
    EXPECT_FALSE(schema.contains("title"));
}

TEST_F(ConversationEngineTest, TextAnswersSendNoResponseFormat) {
    transport->push(text("hi"));
    ConversationEngine engine(transport, "sys");

    ASSERT_FALSE(is_error(engine.run(ask("hello"))));
    EXPECT_FALSE(transport->requests()[0].options.response_format.has_value());
}

TEST_F(ConversationEngineTest, UndecodableAnswerIsFatal) {
    transport->push(text("forty-two"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run<int>(ask("What is 6*7?"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Decode);
}

TEST_F(ConversationEngineTest, RecoverableToolFailureIsFedBack) {
    transport->push(calls({ToolCall{"c1", "0-fail", "{}"}}));
    transport->push(text("The backend is down."));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("status?"), &tools);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).value, "The backend is down.");
    EXPECT_EQ(as<ToolCallResultMessage>(engine.history()[3]).text, "backend unreachable");
}

TEST_F(ConversationEngineTest, NonRecoverableToolFailureIsFatal) {
    transport->push(calls({ToolCall{"c1", "0-crash", "{}"}}));
    transport->push(text("unused"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(transport->request_count(), 1u);
}

TEST_F(ConversationEngineTest, MalformedArgumentsAreReportedToTheModel) {
    transport->push(calls({ToolCall{"c1", "0-echo", "{not json"}}));
    transport->push(text("retrying is pointless"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_FALSE(is_error(result));
    const auto& feedback = as<ToolCallResultMessage>(engine.history()[3]).text;
    EXPECT_NE(feedback.find("not valid JSON"), std::string::npos);
}

TEST_F(ConversationEngineTest, MissingArgumentKeyIsRecoverable) {
    transport->push(calls({ToolCall{"c1", "0-echo", ""}}));
    transport->push(text("ok"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_FALSE(is_error(result));
    const auto& feedback = as<ToolCallResultMessage>(engine.history()[3]).text;
    EXPECT_NE(feedback.find("Invalid arguments"), std::string::npos);
}

TEST_F(ConversationEngineTest, EmptyResponseIsUnexpected) {
    transport->push(ChatResponse{});
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::UnexpectedResponse);
}

TEST_F(ConversationEngineTest, TransportFailureIsFatal) {
    transport->push_error(AgentError{ErrorCategory::Transport, "503", "http_error"});
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "http_error");
}

TEST_F(ConversationEngineTest, PreambleTextNextToToolCallsIsKept) {
    ChatResponse mixed = calls({ToolCall{"c1", "0-echo", R"({"text":"x"})"}});
    mixed.text = "Let me check.";
    transport->push(mixed);
    transport->push(text("checked"));
    ConversationEngine engine(transport, "sys");

    auto result = engine.run(ask("go"), &tools);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).value, "checked");
    EXPECT_EQ(as<AssistantMessage>(engine.history()[2]).text, "Let me check.");
    EXPECT_TRUE(std::holds_alternative<ToolCallRequestMessage>(engine.history()[3]));
}

TEST_F(ConversationEngineTest, RequestCarriesToolsAndDefaults) {
    transport->push(text("hi"));
    ConversationEngine engine(transport, "  padded prompt \n");

    ASSERT_FALSE(is_error(engine.run(ask("hello"), &tools)));
    const auto request = transport->requests()[0];
    EXPECT_EQ(request.model, "test-model");
    ASSERT_TRUE(request.options.temperature.has_value());
    EXPECT_DOUBLE_EQ(request.options.temperature.value(), 0.2);
    ASSERT_EQ(request.tools.size(), 3u);
    EXPECT_EQ(request.tools[0].name, "0-echo");
    EXPECT_EQ(as<SystemMessage>(request.messages[0]).text, "padded prompt");
}

TEST_F(ConversationEngineTest, HistoryPersistsAcrossRuns) {
    transport->push(text("first answer"));
    transport->push(text("second answer"));
    ConversationEngine engine(transport, "sys");

    ASSERT_FALSE(is_error(engine.run(ask("one"))));
    ASSERT_FALSE(is_error(engine.run(ask("two"))));

    EXPECT_EQ(engine.history().size(), 5u);
    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    ASSERT_EQ(requests[1].messages.size(), 4u);
    EXPECT_EQ(as<AssistantMessage>(requests[1].messages[2]).text, "first answer");
}

TEST_F(ConversationEngineTest, ClearAndResetKeepOneSystemMessage) {
    transport->push(text("a"));
    ConversationEngine engine(transport, "sys");
    ASSERT_FALSE(is_error(engine.run(ask("q"))));

    engine.clear_history();
    ASSERT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(as<SystemMessage>(engine.history()[0]).text, "sys");

    engine.reset("new persona");
    ASSERT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(as<SystemMessage>(engine.history()[0]).text, "new persona");
}

TEST_F(ConversationEngineTest, EmitsLifecycleEvents) {
    ChatResponse first = calls({ToolCall{"c1", "0-echo", R"({"text":"x"})"}});
    first.reasoning = "need the echo";
    transport->push(first);
    transport->push(text("done"));
    ConversationEngine engine(transport, "sys");

    std::vector<AgentEvent> events;
    engine.set_observer([&events](const AgentEvent& event) { events.push_back(event); });

    ASSERT_FALSE(is_error(engine.run(ask("go"), &tools)));

    ASSERT_EQ(events.size(), 7u);
    EXPECT_TRUE(std::holds_alternative<RunStartEvent>(events[0]));
    EXPECT_EQ(std::get<TurnStartEvent>(events[1]).iteration, 0u);
    EXPECT_EQ(std::get<ReasoningEvent>(events[2]).text, "need the echo");
    EXPECT_EQ(std::get<ToolExecutionStartEvent>(events[3]).tool_name, "0-echo");
    EXPECT_TRUE(std::get<ToolExecutionEndEvent>(events[4]).success);
    EXPECT_EQ(std::get<TurnStartEvent>(events[5]).iteration, 1u);
    EXPECT_EQ(std::get<RunEndEvent>(events[6]).reason, StopReason::Answered);
}

TEST_F(ConversationEngineTest, FailedRunReportsStopReason) {
    transport->push(calls({ToolCall{"c1", "0-teleport", "{}"}}));
    ConversationEngine engine(transport, "sys");

    std::vector<AgentEvent> events;
    engine.set_observer([&events](const AgentEvent& event) { events.push_back(event); });

    ASSERT_TRUE(is_error(engine.run(ask("go"), &tools)));
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(std::get<RunEndEvent>(events.back()).reason, StopReason::ToolNotFound);
}

TEST_F(ConversationEngineTest, SettingsFollowConfig) {
    agentloop::core::config::EngineConfig config;
    config.max_iterations = 9;
    config.temperature = 0.6;
    config.max_tokens = 128;
    config.skip_unresolved_tools = true;

    const auto settings = agentloop::runtime::settings_from_config(config);
    EXPECT_EQ(settings.default_max_iterations, 9u);
    EXPECT_DOUBLE_EQ(settings.default_options.temperature.value(), 0.6);
    EXPECT_EQ(settings.default_options.max_tokens.value(), 128u);
    EXPECT_EQ(settings.unresolved_tool_policy, UnresolvedToolPolicy::Skip);
}

}  // namespace
