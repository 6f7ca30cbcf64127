#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace zenbot {

enum class LogLevel {
    debug,
    info,
    warn,
    error
};

// Process-wide stderr logger. Lines look like "[tag] message" so they read
// the same as the rest of the console diagnostics.
class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void log(LogLevel level, const std::string& tag, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        std::cerr << "[" << tag << "] ";
        if (level == LogLevel::warn) std::cerr << "Warning: ";
        else if (level == LogLevel::error) std::cerr << "Error: ";
        std::cerr << message << "\n";
    }

private:
    Logger() = default;
    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::info;
};

#define ZENBOT_LOG_DEBUG(tag, msg) ::zenbot::Logger::get().log(::zenbot::LogLevel::debug, tag, msg)
#define ZENBOT_LOG_INFO(tag, msg)  ::zenbot::Logger::get().log(::zenbot::LogLevel::info, tag, msg)
#define ZENBOT_LOG_WARN(tag, msg)  ::zenbot::Logger::get().log(::zenbot::LogLevel::warn, tag, msg)
#define ZENBOT_LOG_ERROR(tag, msg) ::zenbot::Logger::get().log(::zenbot::LogLevel::error, tag, msg)

} // namespace zenbot
