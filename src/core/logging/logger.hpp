#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace hookguard::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Output goes to stderr; stdout is reserved for
    // hook output. Only WARN and above are printed unless --verbose is set.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_invocation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            invocation_id_ = id;
        }

        void set_threshold(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            threshold_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(threshold_)) {
                return;
            }

            std::cerr << "[hookguard] [" << level_to_string(level) << "] "
                      << (invocation_id_.empty() ? "" : "[" + invocation_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string invocation_id_;
        LogLevel threshold_ = LogLevel::WARN;

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

    #define LOG_DEBUG(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::ERROR, msg)

} // namespace hookguard::core::logging
