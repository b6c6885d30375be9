#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/demo_tools.hpp"
#include "core/config/engine_config.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/serialization.hpp"
#include "runtime/conversation_engine.hpp"
#include "tools/tool_registry.hpp"
#include "transport/replay_chat_transport.hpp"

namespace errors = agentloop::core::errors;

namespace {

    void report(const std::string& what, const errors::AgentError& err) {
        LOG_ERROR(what + " [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    agentloop::core::logging::Logger::get().set_run_id(agentloop::core::config::generate_run_id("replay"));

    auto parsed = agentloop::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report("Input error", errors::get_error(parsed));
        return 2;
    }
    const auto& cmd = errors::get_value(parsed);

    // 1. Configuration: file, then environment, then flags
    agentloop::core::config::EngineConfig config;
    if (cmd.config) {
        auto loaded = agentloop::core::config::load_engine_config(cmd.config.value());
        if (errors::is_error(loaded)) {
            report("Config error", errors::get_error(loaded));
            return 3;
        }
        config = errors::get_value(loaded);
    }
    auto overridden = agentloop::core::config::apply_environment_overrides(config);
    if (errors::is_error(overridden)) {
        report("Config error", errors::get_error(overridden));
        return 3;
    }
    config = errors::get_value(overridden);
    if (cmd.model) config.model = cmd.model.value();
    if (cmd.max_iterations) config.max_iterations = cmd.max_iterations.value();

    agentloop::core::logging::Logger::get().set_level(
        cmd.verbose ? agentloop::core::logging::LogLevel::DEBUG : config.log_level);
    LOG_INFO("agentloop_replay: model '" + config.model + "', max " +
             std::to_string(config.max_iterations) + " iterations");

    // 2. Tools
    auto demo = agentloop::app::make_demo_tools();
    if (errors::is_error(demo)) {
        report("Tool setup failed", errors::get_error(demo));
        return 1;
    }
    auto registry = agentloop::tools::make_registry({errors::get_value(demo)});
    if (errors::is_error(registry)) {
        report("Tool setup failed", errors::get_error(registry));
        return 1;
    }
    const auto& tools = errors::get_value(registry);

    // 3. Transport
    auto transport = agentloop::transport::ReplayChatTransport::from_file(cmd.script);
    if (errors::is_error(transport)) {
        report("Input error", errors::get_error(transport));
        return 2;
    }

    // 4. Run
    agentloop::runtime::ConversationEngine engine(
        errors::get_value(transport), config.system_prompt,
        agentloop::runtime::settings_from_config(config));

    agentloop::protocol::RunRequest request;
    request.model = config.model;
    request.prompt = cmd.prompt;
    auto outcome = engine.run<std::string>(request, &tools);

    if (cmd.dump_history) {
        std::cout << agentloop::protocol::history_to_json(engine.history())
                         .dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

    if (errors::is_error(outcome)) {
        report("Run failed (" + errors::to_string(errors::get_error(outcome).category) + ")",
               errors::get_error(outcome));
        return 1;
    }

    const auto& answer = errors::get_value(outcome);
    LOG_INFO("Answered at iteration " + std::to_string(answer.iteration));
    std::cout << answer.value << std::endl;
    return 0;
}
