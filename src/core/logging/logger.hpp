#pragma once
#include <iostream>
#include <mutex>
#include <string>
#include "core/config/ids.hpp"

namespace conductor::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline bool parse_log_level(const std::string& text, LogLevel& out) {
        if (text == "debug") { out = LogLevel::DEBUG; return true; }
        if (text == "info")  { out = LogLevel::INFO;  return true; }
        if (text == "warn")  { out = LogLevel::WARN;  return true; }
        if (text == "error") { out = LogLevel::ERROR; return true; }
        return false;
    }

    // Process-wide logger. Lines go to stderr so agent output captured on
    // stdout is never interleaved with orchestrator diagnostics.
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

        void set_correlation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            correlation_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << config::now_rfc3339() << " [" << level_to_string(level) << "] "
                      << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                      << (correlation_id_.empty() ? "" : "[" + correlation_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
        std::string correlation_id_;
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

    #define LOG_DEBUG(msg) conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::ERROR, msg)

} // namespace conductor::core::logging
