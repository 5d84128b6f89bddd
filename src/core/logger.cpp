#include "core/logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace pitchsync::core {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<std::uint8_t>& MinimumLevelStorage() {
    static std::atomic<std::uint8_t> level{static_cast<std::uint8_t>(LogLevel::Info)};
    return level;
}

std::string BuildTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time);
#else
    localtime_r(&time, &local_tm);
#endif

    std::ostringstream stream;
    stream << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}

}  // namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }

    return "UNKNOWN";
}

bool TryParseLogLevel(std::string_view text, LogLevel& out_level) {
    if (text == "debug") {
        out_level = LogLevel::Debug;
        return true;
    }
    if (text == "info") {
        out_level = LogLevel::Info;
        return true;
    }
    if (text == "warn") {
        out_level = LogLevel::Warn;
        return true;
    }
    if (text == "error") {
        out_level = LogLevel::Error;
        return true;
    }
    return false;
}

void Logger::SetMinimumLevel(LogLevel level) {
    MinimumLevelStorage().store(static_cast<std::uint8_t>(level));
}

LogLevel Logger::MinimumLevel() {
    return static_cast<LogLevel>(MinimumLevelStorage().load());
}

void Logger::Debug(std::string_view module, std::string_view message) {
    Log(LogLevel::Debug, module, message);
}

void Logger::Info(std::string_view module, std::string_view message) {
    Log(LogLevel::Info, module, message);
}

void Logger::Warn(std::string_view module, std::string_view message) {
    Log(LogLevel::Warn, module, message);
}

void Logger::Error(std::string_view module, std::string_view message) {
    Log(LogLevel::Error, module, message);
}

void Logger::Log(
    LogLevel level,
    std::string_view module,
    std::string_view message) {
    if (static_cast<std::uint8_t>(level) < MinimumLevelStorage().load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(LogMutex());
    std::cout << '[' << BuildTimestamp() << "] [" << LogLevelName(level) << "] [" << module << "] "
              << message << '\n';
}

}  // namespace pitchsync::core
