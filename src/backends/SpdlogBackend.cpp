#include "routegraph/backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace routegraph {

namespace {

    /// LOG_LEVEL wins over SPDLOG_LEVEL; info when neither is set
    LogLevel levelFromEnvironment() {
        for (const char* var : {"LOG_LEVEL", "SPDLOG_LEVEL"}) {
            if (const char* value = std::getenv(var)) {
                return parseLogLevel(value, LogLevel::Info);
            }
        }
        return LogLevel::Info;
    }

    spdlog::sink_ptr makeFileSink(const std::string& logDir) {
        std::filesystem::path dir(logDir);
        std::filesystem::create_directories(dir);
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (dir / "routegraph.log").string(), true);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        return sink;
    }

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console};
    if (logToFile && !logDir.empty()) {
        sinks.push_back(makeFileSink(logDir));
    }

    // Deliberately not registered with spdlog's registry so tests can swap
    // backends without name clashes
    logger_ = std::make_shared<spdlog::logger>("routegraph", sinks.begin(), sinks.end());
    logger_->set_level(convertLevel(levelFromEnvironment()));
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
    return spdlog::level::info;
}

}  // namespace routegraph
