#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace synx::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr so a child's captured stdout
    // relayed by the CLI is never interleaved with log lines.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define SYNX_LOG_DEBUG(msg) synx::core::logging::Logger::get().log(synx::core::logging::LogLevel::DEBUG, msg)
    #define SYNX_LOG_INFO(msg)  synx::core::logging::Logger::get().log(synx::core::logging::LogLevel::INFO, msg)
    #define SYNX_LOG_WARN(msg)  synx::core::logging::Logger::get().log(synx::core::logging::LogLevel::WARN, msg)
    #define SYNX_LOG_ERROR(msg) synx::core::logging::Logger::get().log(synx::core::logging::LogLevel::ERROR, msg)

} // namespace synx::core::logging
