#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace common {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

inline const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

// Accepts "debug", "info", "warn"/"warning", "error" (any case)
inline bool parse_log_level(std::string text, LogLevel& out) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "debug") { out = LogLevel::Debug; return true; }
    if (text == "info") { out = LogLevel::Info; return true; }
    if (text == "warn" || text == "warning") { out = LogLevel::Warn; return true; }
    if (text == "error") { out = LogLevel::Error; return true; }
    return false;
}

/**
 * @brief Interface for logging
 * Components receive it by injection and prefix messages with "[Component]".
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

/**
 * @brief Console logger implementation
 * Timestamped output, safe to call from any thread.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info, std::ostream& out = std::cout)
        : min_level_(min_level), out_(out) {}

    void debug(const std::string& message) override { log(LogLevel::Debug, message); }
    void info(const std::string& message) override { log(LogLevel::Info, message); }
    void warn(const std::string& message) override { log(LogLevel::Warn, message); }
    void error(const std::string& message) override { log(LogLevel::Error, message); }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

private:
    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &time);
#else
        localtime_r(&time, &local);
#endif
        out_ << "[" << std::put_time(&local, "%H:%M:%S")
             << "] [" << to_string(level) << "] " << message << "\n";
        out_.flush();
    }

    std::mutex mutex_;
    LogLevel min_level_;
    std::ostream& out_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public ILogger {
public:
    void debug(const std::string&) override {}
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
};

inline std::shared_ptr<ILogger> make_null_logger() {
    return std::make_shared<NullLogger>();
}

} // namespace common
