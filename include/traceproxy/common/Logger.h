#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace traceproxy {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    bool IsEnabled(LogLevel level) const { return level >= GetLevel(); }
    LogLevel ParseLevel(const std::string& levelStr);

    // Destination stream (defaults to std::cout). Colors are only emitted when the
    // stream is a terminal-backed std::cout and colors are enabled.
    void SetStream(std::ostream* out);
    void SetColorEnabled(bool on);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ostream* out_{nullptr};
    bool color_{true};
    std::mutex mutex_;
};

// Collects one record; flushed to the Logger on destruction.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace traceproxy

#define LOG_DEBUG \
    if (traceproxy::common::Logger::Instance().IsEnabled(traceproxy::common::LogLevel::DEBUG)) \
    traceproxy::common::LogStream(traceproxy::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (traceproxy::common::Logger::Instance().IsEnabled(traceproxy::common::LogLevel::INFO)) \
    traceproxy::common::LogStream(traceproxy::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (traceproxy::common::Logger::Instance().IsEnabled(traceproxy::common::LogLevel::WARN)) \
    traceproxy::common::LogStream(traceproxy::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (traceproxy::common::Logger::Instance().IsEnabled(traceproxy::common::LogLevel::ERROR)) \
    traceproxy::common::LogStream(traceproxy::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (traceproxy::common::Logger::Instance().IsEnabled(traceproxy::common::LogLevel::FATAL)) \
    traceproxy::common::LogStream(traceproxy::common::LogLevel::FATAL, __FILE__, __LINE__)
