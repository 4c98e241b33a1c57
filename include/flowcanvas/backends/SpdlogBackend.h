#pragma once

#include "flowcanvas/common/ILoggerBackend.h"

#include <memory>
#include <spdlog/spdlog.h>

namespace flowcanvas {

/**
 * @brief spdlog-based backend
 *
 * Console sink always, plus a "flowcanvas.log" file sink in logDir when
 * logToFile is set. The LOG_LEVEL (or SPDLOG_LEVEL) environment variable
 * overrides the initial debug level.
 *
 * Default backend when FLOWCANVAS_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
    static std::shared_ptr<spdlog::logger> createLogger(const std::string& logDir, bool logToFile);
};

}  // namespace flowcanvas
