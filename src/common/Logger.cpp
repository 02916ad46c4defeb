#include "traceproxy/common/Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace traceproxy {
namespace common {

namespace {

std::string FormatNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmLocal{};
    ::localtime_r(&secs, &tmLocal);

    std::ostringstream ss;
    ss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
    }
    return "\033[0m";
}

// Strip the directory part so records stay short.
const char* BaseName(const char* file) {
    const char* base = file;
    for (const char* p = file; *p; ++p) {
        if (*p == '/') base = p + 1;
    }
    return base;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetStream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
}

void Logger::SetColorEnabled(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = on;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostream& os = out_ ? *out_ : std::cout;
    const bool colored = color_ && out_ == nullptr;

    // [time] [LEVEL] [file:line] message
    if (colored) os << LevelColor(level);
    os << "[" << FormatNow() << "] "
       << "[" << LevelName(level) << "] "
       << "[" << BaseName(file) << ":" << line << "] "
       << msg;
    if (colored) os << "\033[0m";
    os << std::endl;
}

} // namespace common
} // namespace traceproxy
