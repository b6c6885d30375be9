#include "core/config/engine_config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

namespace agentloop::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::uint32_t kMaxIterationsUpperBound = 1000;
constexpr double kMaxTemperature = 2.0;

AgentError invalid_config(const std::string& message, const std::string& hint = "") {
    return AgentError{ErrorCategory::Input, message, "invalid_config", hint};
}

std::optional<std::uint32_t> parse_uint(const std::string& text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// Accepts both signed and unsigned JSON integers; literals built in code are
// stored signed.
std::optional<std::uint32_t> read_uint(const json& value) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    const auto number = value.get<std::int64_t>();
    if (number < 0 || number > static_cast<std::int64_t>(UINT32_MAX)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(number);
}

std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<AgentError> validate(const EngineConfig& config) {
    if (config.max_iterations == 0 || config.max_iterations > kMaxIterationsUpperBound) {
        return invalid_config("max_iterations out of bounds",
                              "Must be between 1 and 1000.");
    }
    if (config.temperature < 0.0 || config.temperature > kMaxTemperature) {
        return invalid_config("temperature out of bounds", "Must be between 0 and 2.");
    }
    if (config.top_p.has_value() && (*config.top_p <= 0.0 || *config.top_p > 1.0)) {
        return invalid_config("top_p out of bounds", "Must be in (0, 1].");
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> process_environment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<EngineConfig> parse_engine_config(const json& document) {
    if (!document.is_object()) {
        return invalid_config("Config root must be a JSON object.");
    }

    EngineConfig config;
    if (document.contains("model")) {
        if (!document["model"].is_string()) {
            return invalid_config("'model' must be a string.");
        }
        config.model = document["model"].get<std::string>();
    }
    if (document.contains("system_prompt")) {
        if (!document["system_prompt"].is_string()) {
            return invalid_config("'system_prompt' must be a string.");
        }
        config.system_prompt = document["system_prompt"].get<std::string>();
    }
    if (document.contains("max_iterations")) {
        const auto value = read_uint(document["max_iterations"]);
        if (!value.has_value()) {
            return invalid_config("'max_iterations' must be a positive integer.");
        }
        config.max_iterations = value.value();
    }
    if (document.contains("temperature")) {
        if (!document["temperature"].is_number()) {
            return invalid_config("'temperature' must be a number.");
        }
        config.temperature = document["temperature"].get<double>();
    }
    if (document.contains("max_tokens") && !document["max_tokens"].is_null()) {
        const auto value = read_uint(document["max_tokens"]);
        if (!value.has_value()) {
            return invalid_config("'max_tokens' must be a positive integer.");
        }
        config.max_tokens = value.value();
    }
    if (document.contains("top_p") && !document["top_p"].is_null()) {
        if (!document["top_p"].is_number()) {
            return invalid_config("'top_p' must be a number.");
        }
        config.top_p = document["top_p"].get<double>();
    }
    if (document.contains("log_level")) {
        const auto level = document["log_level"].is_string()
                               ? logging::parse_log_level(document["log_level"].get<std::string>())
                               : std::nullopt;
        if (!level.has_value()) {
            return invalid_config("'log_level' must be one of trace, debug, info, warn, error.");
        }
        config.log_level = level.value();
    }
    if (document.contains("unresolved_tools")) {
        const auto& policy = document["unresolved_tools"];
        if (policy == "fatal") {
            config.skip_unresolved_tools = false;
        } else if (policy == "skip") {
            config.skip_unresolved_tools = true;
        } else {
            return invalid_config("'unresolved_tools' must be \"fatal\" or \"skip\".");
        }
    }

    if (auto error = validate(config)) {
        return error.value();
    }
    return config;
}

errors::Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open config file: " + path.string(),
                          "config_not_found"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return invalid_config("Config file is not valid JSON: " + path.string());
    }
    return parse_engine_config(document);
}

errors::Result<EngineConfig> apply_environment_overrides(EngineConfig config,
                                                         const EnvLookup& lookup) {
    if (auto model = lookup("AGENTLOOP_MODEL")) {
        config.model = model.value();
    }
    if (auto raw = lookup("AGENTLOOP_MAX_ITERATIONS")) {
        const auto value = parse_uint(raw.value());
        if (!value.has_value()) {
            return invalid_config("AGENTLOOP_MAX_ITERATIONS is not an integer: " + raw.value());
        }
        config.max_iterations = value.value();
    }
    if (auto raw = lookup("AGENTLOOP_TEMPERATURE")) {
        const auto value = parse_double(raw.value());
        if (!value.has_value()) {
            return invalid_config("AGENTLOOP_TEMPERATURE is not a number: " + raw.value());
        }
        config.temperature = value.value();
    }
    if (auto raw = lookup("AGENTLOOP_LOG_LEVEL")) {
        const auto level = logging::parse_log_level(raw.value());
        if (!level.has_value()) {
            return invalid_config("AGENTLOOP_LOG_LEVEL is not a log level: " + raw.value());
        }
        config.log_level = level.value();
    }

    if (auto error = validate(config)) {
        return error.value();
    }
    return config;
}

}  // namespace agentloop::core::config
