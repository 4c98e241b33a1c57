#pragma once

#include <source_location>
#include <string>

namespace flowcanvas {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Sink for flowcanvas log records
 *
 * Implement this to route editor diagnostics into the host application's
 * logging system:
 * @code
 * class HostLogger : public flowcanvas::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_->setThreshold(static_cast<int>(level)); }
 *     void flush() override { host_->flush(); }
 * };
 *
 * flowcanvas::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace flowcanvas
