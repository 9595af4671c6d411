#ifndef TYL_ERROR_SETTINGS_H
#define TYL_ERROR_SETTINGS_H

#include <cstddef>
#include <optional>
#include <string>
#include "data_logger.h"

namespace tyl {

// Environment lookup that distinguishes "unset" from "set to empty".
std::optional<std::string> safe_getenv(const char* name);

/**
 * Process-wide error configuration.
 *
 * | Variable                | Default | Description                                  |
 * |-------------------------|---------|----------------------------------------------|
 * | TYL_ERROR_BACKTRACE     | false   | "true" enables backtraces                    |
 * | TYL_BACKTRACE           | -       | enables backtraces when the above is unset   |
 * | TYL_ERROR_MAX_RETRIES   | 3       | maximum retry attempts for retriable errors  |
 * | TYL_ERROR_LOG_ERRORS    | true    | "false" disables diagnostic output           |
 * | TYL_ERROR_LOG_LEVEL     | INFO    | ERROR / WARN / INFO / DEBUG                  |
 */
struct ErrorSettings {
    bool backtrace_enabled = false;
    std::size_t max_retries = 3;
    bool log_errors = true;
    LogLevel log_level = LogLevel::INFO;

    ErrorSettings() = default;
    ErrorSettings(bool backtrace_enabled, std::size_t max_retries, bool log_errors, LogLevel log_level);

    // Read once on first access and cached for the lifetime of the process.
    static const ErrorSettings& global();

    // Uncached read of the environment.
    static ErrorSettings from_environment();
};

} // namespace tyl

#endif // TYL_ERROR_SETTINGS_H
