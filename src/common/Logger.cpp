#include "flowcanvas/common/Logger.h"

#ifdef FLOWCANVAS_USE_SPDLOG
#include "flowcanvas/backends/SpdlogBackend.h"
#else
#include "flowcanvas/backends/DefaultBackend.h"
#endif

#include <mutex>

namespace flowcanvas {

namespace {

std::unique_ptr<ILoggerBackend> g_backend;
std::mutex g_backendMutex;

bool g_captureEnabled = false;
std::vector<std::string> g_capturedLogs;
std::mutex g_captureMutex;

std::unique_ptr<ILoggerBackend> makeDefaultBackend([[maybe_unused]] const std::string& logDir,
                                                   [[maybe_unused]] bool logToFile) {
#ifdef FLOWCANVAS_USE_SPDLOG
    return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    return std::make_unique<DefaultBackend>();
#endif
}

// Caller holds g_backendMutex
ILoggerBackend& backendLocked() {
    if (!g_backend) {
        g_backend = makeDefaultBackend("", false);
    }
    return *g_backend;
}

const char* captureTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "[trace] ";
        case LogLevel::Debug: return "[debug] ";
        case LogLevel::Info: return "[info] ";
        case LogLevel::Warn: return "[warn] ";
        case LogLevel::Error: return "[error] ";
        case LogLevel::Critical: return "[critical] ";
        case LogLevel::Off: break;
    }
    return "";
}

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(g_backendMutex);
    g_backend = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(g_backendMutex);
    if (!g_backend) {
        g_backend = makeDefaultBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_backendMutex);
    backendLocked().setLevel(level);
}

void Logger::log(LogLevel level, const std::string& message, const std::source_location& loc) {
    std::string line = functionName(loc) + "() - " + message;
    {
        std::lock_guard<std::mutex> lock(g_backendMutex);
        backendLocked().log(level, line, loc);
    }

    std::lock_guard<std::mutex> lock(g_captureMutex);
    if (g_captureEnabled) {
        g_capturedLogs.push_back(captureTag(level) + line);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(g_backendMutex);
    backendLocked().flush();
}

// ===== Log Capture Implementation =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(g_captureMutex);
    g_captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(g_captureMutex);
    return g_captureEnabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(g_captureMutex);

    std::vector<std::string> result;
    for (const auto& line : g_capturedLogs) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(g_captureMutex);
    g_capturedLogs.clear();
}

// "void flowcanvas::DiagramStore::addEdge(NodeId, NodeId)" -> "DiagramStore::addEdge"
std::string Logger::functionName(const std::source_location& loc) {
    std::string signature = loc.function_name();

    size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return signature.empty() ? "Unknown" : signature;
    }

    // Start after the last space outside template brackets
    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) start = i + 1;
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0 && c != '*' && c != '&') name += c;
    }

    const std::string ns = "flowcanvas::";
    if (name.rfind(ns, 0) == 0) {
        name.erase(0, ns.size());
    }
    return name.empty() ? "Unknown" : name;
}

}  // namespace flowcanvas
