#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace common {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

/**
 * @brief Interface for logging
 * Implementations must be callable from any thread.
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void write(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { write(LogLevel::Debug, message); }
    void info(const std::string& message) { write(LogLevel::Info, message); }
    void warning(const std::string& message) { write(LogLevel::Warning, message); }
    void error(const std::string& message) { write(LogLevel::Error, message); }
};

/**
 * @brief Console logger implementation
 * Timestamped `[HH:MM:SS] [LEVEL] [Tag] message` lines, errors go to stderr.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(std::string tag = "Reporter", LogLevel min_level = LogLevel::Info)
        : tag_(std::move(tag)), min_level_(min_level) {}

    void write(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&time, &local);

        std::lock_guard<std::mutex> lock(output_mutex());
        std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
        out << "[" << std::put_time(&local, "%H:%M:%S")
            << "] [" << log_level_name(level) << "] [" << tag_ << "] "
            << message << std::endl;
    }

private:
    static std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    std::string tag_;
    LogLevel min_level_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public ILogger {
public:
    void write(LogLevel, const std::string&) override {}
};

} // namespace common
