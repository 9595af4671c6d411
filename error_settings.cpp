// error_settings.cpp - environment driven configuration

#include <cstdlib>
#include <string>
#include <algorithm>
#include <cctype>
#include "error_settings.h"

namespace tyl {

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Digits with an optional leading '+'
static std::optional<std::size_t> parse_unsigned(const std::string& text) {
    std::string digits = (!text.empty() && text[0] == '+') ? text.substr(1) : text;
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoull(digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::string> safe_getenv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

ErrorSettings::ErrorSettings(bool backtrace_enabled, std::size_t max_retries, bool log_errors, LogLevel log_level)
    : backtrace_enabled(backtrace_enabled),
      max_retries(max_retries),
      log_errors(log_errors),
      log_level(log_level) {}

ErrorSettings ErrorSettings::from_environment() {
    ErrorSettings settings;

    if (auto backtrace = safe_getenv("TYL_ERROR_BACKTRACE")) {
        settings.backtrace_enabled = to_lower(*backtrace) == "true";
    } else {
        settings.backtrace_enabled = safe_getenv("TYL_BACKTRACE").has_value();
    }

    if (auto retries = safe_getenv("TYL_ERROR_MAX_RETRIES")) {
        settings.max_retries = parse_unsigned(*retries).value_or(3);
    }

    if (auto log_errors = safe_getenv("TYL_ERROR_LOG_ERRORS")) {
        settings.log_errors = to_lower(*log_errors) != "false";
    }

    if (auto level = safe_getenv("TYL_ERROR_LOG_LEVEL")) {
        settings.log_level = parse_log_level(*level).value_or(LogLevel::INFO);
    }

    return settings;
}

const ErrorSettings& ErrorSettings::global() {
    static const ErrorSettings settings = from_environment();
    return settings;
}

} // namespace tyl
