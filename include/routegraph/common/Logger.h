#pragma once

#include "routegraph/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace routegraph {

/**
 * @brief Process-wide logging facade
 *
 * Records go to the injected ILoggerBackend, or to a SpdlogBackend created on
 * first use. A capture buffer can additionally keep every record in memory,
 * which the tests use to assert on warnings.
 *
 * Thread-safe: backend replacement and capture are guarded by mutexes.
 *
 * Example:
 * @code
 * routegraph::Logger::initialize("logs", true);
 * LOG_INFO("Laid out {} routes in {} ranks", nodes, ranks);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Host backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the default console backend if none is set
     */
    static void initialize();

    /**
     * @brief Create the default backend with an additional log file
     * @param logDir Directory for routegraph.log
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    // Logging methods
    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Start or stop keeping records in memory
     *
     * Captured lines look like "[warn] Function() - message".
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Captured lines, oldest first
     * @param pattern Substring filter (empty = all)
     * @param maxLines Keep only the last N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace routegraph

// Logging macros with std::format support
#define LOG_TRACE(...) routegraph::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) routegraph::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  routegraph::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  routegraph::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) routegraph::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
