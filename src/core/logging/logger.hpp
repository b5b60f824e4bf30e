#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace planloop::core::logging {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3
    };

    // One logger for the whole process. Writes are serialized so the
    // worker thread of a run and the caller can both log.
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

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Passing nullptr restores std::clog.
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink != nullptr ? sink : &std::clog;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            *sink_ << "[" << level_to_string(level) << "] "
                   << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                   << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug") { out = LogLevel::DEBUG; return true; }
            if (text == "info")  { out = LogLevel::INFO;  return true; }
            if (text == "warn")  { out = LogLevel::WARN;  return true; }
            if (text == "error") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::clog;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) planloop::core::logging::Logger::get().log(planloop::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  planloop::core::logging::Logger::get().log(planloop::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  planloop::core::logging::Logger::get().log(planloop::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) planloop::core::logging::Logger::get().log(planloop::core::logging::LogLevel::ERROR, msg)

} // namespace planloop::core::logging
