#include "flowcanvas/backends/DefaultBackend.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace flowcanvas {

DefaultBackend::DefaultBackend() : currentLevel_(LogLevel::Info) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || level == LogLevel::Off) return;

    std::cout << "[" << timestamp() << "] ["
              << levelToColor(level) << levelToString(level) << "\033[0m] "
              << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

const char* DefaultBackend::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        case LogLevel::Off: break;
    }
    return "";
}

std::string DefaultBackend::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d",
                  local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));
    return buffer;
}

}  // namespace flowcanvas
