#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace agentloop::app::cli {

    // Validated form of `agentloop_replay run ...`
    struct ReplayCommand {
        std::filesystem::path script;
        std::string prompt;
        std::optional<std::filesystem::path> config;
        std::optional<std::string> model;
        std::optional<std::uint32_t> max_iterations;
        bool verbose = false;
        bool dump_history = false;
    };

    agentloop::core::errors::Result<ReplayCommand> parse_and_validate(int argc, char* argv[]);

} // namespace agentloop::app::cli
