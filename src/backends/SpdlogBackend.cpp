#include "flowcanvas/backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

namespace flowcanvas {

namespace {

constexpr const char* LOGGER_NAME = "flowcanvas";
constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

void applyEnvironmentLevel(spdlog::logger& logger) {
    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }
    if (!envLevel) return;

    std::string name(envLevel);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "warning") name = "warn";
    if (name == "error") name = "err";

    // from_str maps unknown names to off; keep the current level instead
    auto level = spdlog::level::from_str(name);
    if (level != spdlog::level::off || name == "off") {
        logger.set_level(level);
    }
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile)
    : logger_(createLogger(logDir, logToFile)) {
    logger_->set_level(spdlog::level::debug);
    applyEnvironmentLevel(*logger_);
}

std::shared_ptr<spdlog::logger> SpdlogBackend::createLogger(const std::string& logDir, bool logToFile) {
    // A host may have registered the name already (or a previous backend did)
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "flowcanvas.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    return logger;
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::debug;
}

}  // namespace flowcanvas
