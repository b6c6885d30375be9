#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"

namespace agentloop::core::config {

struct EngineConfig {
    std::string model;
    std::string system_prompt = "You are a helpful assistant.";
    std::uint32_t max_iterations = 5;
    double temperature = 0.2;
    std::optional<std::uint32_t> max_tokens;
    std::optional<double> top_p;
    logging::LogLevel log_level = logging::LogLevel::INFO;
    bool skip_unresolved_tools = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// std::getenv, with unset and empty both mapped to nullopt.
std::optional<std::string> process_environment(const std::string& name);

// Keys: model, system_prompt, max_iterations, temperature, max_tokens,
// top_p, log_level, unresolved_tools ("fatal" | "skip"). Unknown keys are
// ignored; absent keys keep their defaults.
errors::Result<EngineConfig> parse_engine_config(const nlohmann::json& document);

errors::Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

// AGENTLOOP_MODEL, AGENTLOOP_MAX_ITERATIONS, AGENTLOOP_TEMPERATURE,
// AGENTLOOP_LOG_LEVEL win over file values.
errors::Result<EngineConfig> apply_environment_overrides(
    EngineConfig config, const EnvLookup& lookup = process_environment);

}  // namespace agentloop::core::config
