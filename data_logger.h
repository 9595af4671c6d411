#ifndef TYL_DATA_LOGGER_H
#define TYL_DATA_LOGGER_H

#include <optional>
#include <ostream>
#include <string>

// Fix ERROR macro conflict with Windows
#ifdef ERROR
#undef ERROR
#endif

namespace tyl {

// Ordered by verbosity: ERROR is the most severe and the least verbose.
enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

std::string level_to_string(LogLevel level);

// Accepts ERROR, WARN, WARNING, INFO and DEBUG in any case.
std::optional<LogLevel> parse_log_level(const std::string& text);

// Main logging function, writes "[LEVEL] message" to the diagnostic stream
void log_message(LogLevel level, const std::string& message);

// Specialized logging functions
void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_error(const std::string& message);

// Redirect diagnostic output (nullptr restores std::cerr)
void set_log_stream(std::ostream* stream);

} // namespace tyl

#endif // TYL_DATA_LOGGER_H
