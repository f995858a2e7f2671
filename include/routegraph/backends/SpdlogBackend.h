#pragma once

#include "routegraph/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace routegraph {

/**
 * @brief Default logger backend built on spdlog
 *
 * Console sink always; a file sink (`<logDir>/routegraph.log`) when
 * `logToFile` is set. The initial level comes from the LOG_LEVEL (or
 * SPDLOG_LEVEL) environment variable and defaults to info.
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
};

}  // namespace routegraph
