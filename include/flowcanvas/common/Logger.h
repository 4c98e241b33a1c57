#pragma once

#include "flowcanvas/common/ILoggerBackend.h"

#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace flowcanvas {

/**
 * @brief Process-wide logging facade used by every flowcanvas component
 *
 * The backend is chosen lazily on first use (SpdlogBackend when built with
 * FLOWCANVAS_USE_SPDLOG, DefaultBackend otherwise) unless the host injects
 * one with setBackend(). Capture mode keeps a copy of every record in
 * memory, which tests use to assert on rejected operations.
 *
 * @code
 * flowcanvas::Logger::initialize();
 * flowcanvas::Logger::enableCapture(true);
 * LOG_DEBUG("Edge {} -> {} rejected", source, target);
 * auto lines = flowcanvas::Logger::getCapturedLogs("rejected");
 * @endcode
 */
class Logger {
public:
    /// Replace the backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the default backend, console only. No-op if a backend exists.
    static void initialize();

    /// Install the default backend with an optional log file in logDir
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string& message,
                    const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /**
     * @brief Captured records, oldest first
     * @param pattern Substring filter (empty = all)
     * @param maxLines Keep only the newest maxLines matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::string functionName(const std::source_location& loc);
};

}  // namespace flowcanvas

#define FLOWCANVAS_LOG(level, ...) \
    flowcanvas::Logger::log(level, fmt::format(__VA_ARGS__), std::source_location::current())

#define LOG_TRACE(...) FLOWCANVAS_LOG(flowcanvas::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) FLOWCANVAS_LOG(flowcanvas::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  FLOWCANVAS_LOG(flowcanvas::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  FLOWCANVAS_LOG(flowcanvas::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) FLOWCANVAS_LOG(flowcanvas::LogLevel::Error, __VA_ARGS__)
