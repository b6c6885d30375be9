#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <utility>
#include <vector>

namespace agentloop::app::cli {

    using namespace agentloop::core::errors;

    namespace {

        constexpr const char* kUsage =
            "Usage: agentloop_replay run --script <file> --prompt \"...\" "
            "[--config <file>] [--model <id>] [--max-iterations N] [--verbose] [--dump-history]";

        struct RawCliOptions {
            std::optional<std::string> script;
            std::optional<std::string> prompt;
            std::optional<std::string> config;
            std::optional<std::string> model;
            std::optional<std::string> max_iterations;
            bool verbose = false;
            bool dump_history = false;
        };

        bool is_regular_file(const std::filesystem::path& p) {
            std::error_code ec;
            const bool exists = std::filesystem::exists(p, ec);
            if (ec || !exists) {
                return false;
            }
            const bool regular = std::filesystem::is_regular_file(p, ec);
            return !ec && regular;
        }

    } // namespace

    Result<ReplayCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                              "Currently only the 'run' command is supported."};
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        RawCliOptions raw;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            std::optional<std::string>* slot = nullptr;
            if (flag == "--script") slot = &raw.script;
            else if (flag == "--prompt") slot = &raw.prompt;
            else if (flag == "--config") slot = &raw.config;
            else if (flag == "--model") slot = &raw.model;
            else if (flag == "--max-iterations") slot = &raw.max_iterations;
            else if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            } else if (flag == "--dump-history") {
                raw.dump_history = true;
                continue;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument", kUsage};
            }

            if (i + 1 >= args.size()) {
                return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            *slot = args[++i];
        }

        if (!raw.script.has_value()) {
            return AgentError{ErrorCategory::Input, "Must provide --script", "missing_required_flag", kUsage};
        }
        if (!raw.prompt.has_value() || raw.prompt->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide a non-empty --prompt", "missing_required_flag", kUsage};
        }

        ReplayCommand cmd;
        cmd.prompt = raw.prompt.value();
        cmd.verbose = raw.verbose;
        cmd.dump_history = raw.dump_history;
        cmd.model = raw.model;

        cmd.script = std::filesystem::path(raw.script.value());
        if (!cli::is_regular_file(cmd.script)) {
            return AgentError{ErrorCategory::Input, "Replay script does not exist or is not a file", "invalid_path"};
        }

        if (raw.config) {
            std::filesystem::path config_path(raw.config.value());
            if (!cli::is_regular_file(config_path)) {
                return AgentError{ErrorCategory::Input, "Config file does not exist or is not a file", "invalid_path"};
            }
            cmd.config = std::move(config_path);
        }

        if (raw.max_iterations) {
            uint32_t bound = 0;
            const char* begin = raw.max_iterations->data();
            const char* end = raw.max_iterations->data() + raw.max_iterations->size();
            auto [ptr, ec] = std::from_chars(begin, end, bound);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-iterations", "invalid_integer",
                                  "Provide a positive integer."};
            }
            if (bound == 0 || bound > 1000) {
                return AgentError{ErrorCategory::Input, "--max-iterations out of bounds", "bounds_error",
                                  "Must be between 1 and 1000."};
            }
            cmd.max_iterations = bound;
        }

        return cmd;
    }

} // namespace agentloop::app::cli
