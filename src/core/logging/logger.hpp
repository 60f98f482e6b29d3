#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace octavius::core::logging {

    // 1. Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Logger
    // Components take a Logger& so tests can hand them a private instance
    // writing to a string stream. The executable uses the process logger.
    class Logger {
    public:
        explicit Logger(std::ostream& out = std::clog, LogLevel min_level = LogLevel::INFO)
            : out_(&out), min_level_(min_level) {}

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        // Process-wide logger, configured once by main() through init().
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void init(LogLevel min_level, std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = min_level;
            out_ = &out;
        }

        void shutdown() {
            std::lock_guard<std::mutex> lock(mutex_);
            out_->flush();
        }

        void set_context(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = id;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (context_.empty() ? "" : "[" + context_ + "] ")
                  << message << std::endl;
        }

        void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
        void info(const std::string& message) { log(LogLevel::INFO, message); }
        void warn(const std::string& message) { log(LogLevel::WARN, message); }
        void error(const std::string& message) { log(LogLevel::ERROR, message); }

    private:
        std::mutex mutex_;
        std::ostream* out_;
        LogLevel min_level_;
        std::string context_;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for the executable
    #define LOG_DEBUG(msg) octavius::core::logging::Logger::get().debug(msg)
    #define LOG_INFO(msg)  octavius::core::logging::Logger::get().info(msg)
    #define LOG_WARN(msg)  octavius::core::logging::Logger::get().warn(msg)
    #define LOG_ERROR(msg) octavius::core::logging::Logger::get().error(msg)

} // namespace octavius::core::logging
