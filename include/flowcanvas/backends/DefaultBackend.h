#pragma once

#include "flowcanvas/common/ILoggerBackend.h"

#include <mutex>

namespace flowcanvas {

/**
 * @brief Dependency-free stdout backend
 *
 * Prints "[HH:MM:SS.mmm] [level] message" with ANSI level colors.
 * Used when the library is built without FLOWCANVAS_USE_SPDLOG.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char* levelToString(LogLevel level);
    static const char* levelToColor(LogLevel level);
    static std::string timestamp();
};

}  // namespace flowcanvas
