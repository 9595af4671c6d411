// data_logger.cpp - diagnostic line output

#include <iostream>
#include <string>
#include <mutex>
#include <algorithm>
#include <cctype>
#include "data_logger.h"

namespace tyl {

static std::mutex log_mutex;
static std::ostream* log_stream = nullptr;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    return std::nullopt;
}

void set_log_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_stream = stream;
}

void log_message(LogLevel level, const std::string& message) {
    std::string log_entry = "[" + level_to_string(level) + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ostream& out = log_stream ? *log_stream : std::cerr;
    out << log_entry << std::endl;
}

void log_debug(const std::string& message) {
    log_message(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log_message(LogLevel::INFO, message);
}

void log_warning(const std::string& message) {
    log_message(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log_message(LogLevel::ERROR, message);
}

} // namespace tyl
