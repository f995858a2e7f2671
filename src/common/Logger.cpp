#include "routegraph/common/Logger.h"
#include "routegraph/backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <mutex>

namespace routegraph {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

    std::mutex& backendMutex() {
        static std::mutex m;
        return m;
    }

    /// In-memory copy of emitted records, used by tests to assert on warnings
    struct CaptureBuffer {
        std::mutex mutex;
        bool enabled = false;
        std::vector<std::string> lines;
    };

    CaptureBuffer& captureBuffer() {
        static CaptureBuffer buffer;
        return buffer;
    }

    std::string lowercase(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool isPrefixJunk(char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '*' || c == '&';
    }

}  // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    const std::string key = lowercase(name);
    if (key == "warning") return LogLevel::Warn;
    if (key == "err") return LogLevel::Error;

    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                           LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        if (key == toString(level)) {
            return level;
        }
    }
    return fallback;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex());
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex());
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    initialize();
    std::lock_guard<std::mutex> lock(backendMutex());
    backend_->setLevel(level);
}

void Logger::flush() {
    initialize();
    std::lock_guard<std::mutex> lock(backendMutex());
    backend_->flush();
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::source_location& loc) {
    initialize();

    std::string line = extractFunctionName(loc);
    line.append("() - ").append(message);

    {
        std::lock_guard<std::mutex> lock(backendMutex());
        if (backend_) {
            backend_->log(level, line, loc);
        }
    }

    captureLog("[" + std::string(toString(level)) + "] " + line);
}

void Logger::enableCapture(bool enable) {
    CaptureBuffer& buffer = captureBuffer();
    std::lock_guard<std::mutex> lock(buffer.mutex);
    buffer.enabled = enable;
}

bool Logger::isCaptureEnabled() {
    CaptureBuffer& buffer = captureBuffer();
    std::lock_guard<std::mutex> lock(buffer.mutex);
    return buffer.enabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    CaptureBuffer& buffer = captureBuffer();
    std::lock_guard<std::mutex> lock(buffer.mutex);

    std::vector<std::string> matches;
    std::copy_if(buffer.lines.begin(), buffer.lines.end(), std::back_inserter(matches),
                 [&pattern](const std::string& line) {
                     return pattern.empty() || line.find(pattern) != std::string::npos;
                 });

    if (maxLines > 0 && matches.size() > maxLines) {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return matches;
}

void Logger::clearCapturedLogs() {
    CaptureBuffer& buffer = captureBuffer();
    std::lock_guard<std::mutex> lock(buffer.mutex);
    buffer.lines.clear();
}

void Logger::captureLog(const std::string& message) {
    CaptureBuffer& buffer = captureBuffer();
    std::lock_guard<std::mutex> lock(buffer.mutex);
    if (buffer.enabled) {
        buffer.lines.push_back(message);
    }
}

// "void routegraph::InteractionController::focusRoot(uint64_t)" -> "routegraph::InteractionController::focusRoot"
std::string Logger::extractFunctionName(const std::source_location& loc) {
    const std::string signature = loc.function_name();
    const size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    // Drop the return type and any template arguments in one pass
    std::string name;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0) {
            if (c == ' ') {
                name.clear();
            } else {
                name += c;
            }
        }
    }

    auto first = std::find_if_not(name.begin(), name.end(), isPrefixJunk);
    name.erase(name.begin(), first);
    return name.empty() ? "Unknown" : name;
}

}  // namespace routegraph
