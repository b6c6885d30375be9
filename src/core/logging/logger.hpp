#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace agentloop::core::logging {

    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "trace") return LogLevel::TRACE;
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Singleton access so the whole process shares one logger
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Stream must outlive the logger or be reset before it dies.
        void set_sink(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &out;
        }

        void reset_sink() {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &std::cout;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cout;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE: return "TRACE";
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_TRACE(msg) agentloop::core::logging::Logger::get().log(agentloop::core::logging::LogLevel::TRACE, msg)
    #define LOG_DEBUG(msg) agentloop::core::logging::Logger::get().log(agentloop::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  agentloop::core::logging::Logger::get().log(agentloop::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  agentloop::core::logging::Logger::get().log(agentloop::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) agentloop::core::logging::Logger::get().log(agentloop::core::logging::LogLevel::ERROR, msg)

} // namespace agentloop::core::logging
