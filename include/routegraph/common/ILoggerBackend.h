#pragma once

#include <source_location>
#include <string>

namespace routegraph {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// "trace", "debug", "info", "warn", "error", "critical" or "off"
const char* toString(LogLevel level);

/// Parse a level name (case-insensitive, "warning" and "err" accepted).
/// Returns `fallback` for unknown names.
LogLevel parseLogLevel(const std::string& name, LogLevel fallback);

/**
 * @brief Sink for log records emitted through routegraph::Logger
 *
 * The host application (an editor, a dev server) usually owns its own logging
 * setup; implementing this interface routes the library's messages into it.
 *
 * Example:
 * @code
 * class HostLogger : public routegraph::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_.write(toString(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_.setThreshold(level); }
 *     void flush() override { host_.flush(); }
 * };
 *
 * routegraph::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Write one pre-formatted record
     * @param level Severity
     * @param message Message text, already prefixed with the calling function
     * @param loc Where the record was emitted
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /**
     * @brief Drop records below `level`
     */
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace routegraph
