// error_handler.cpp - retry helpers and payload decoding

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "error_handler.h"
#include "data_logger.h"

namespace tyl {

bool is_retriable(const ErrorCategory& category) {
    return category.is_retriable();
}

std::chrono::milliseconds calculate_retry_delay(const ErrorCategory& category, std::size_t attempt) {
    return category.retry_delay(attempt);
}

bool should_retry(const TylError& error, std::size_t attempt) {
    return error.should_retry(attempt);
}

std::chrono::milliseconds retry_delay(const TylError& error, std::size_t attempt) {
    return error.category().retry_delay(attempt);
}

std::size_t max_retries(const TylError&) {
    return TylError::max_retries();
}

std::string encode_error(const TylError& error) {
    json j = error;
    return j.dump();
}

std::string encode_context(const ErrorContext& context) {
    json j = context;
    return j.dump();
}

TylError decode_error(const std::string& payload) {
    try {
        return json::parse(payload).get<TylError>();
    } catch (const json::exception& e) {
        return TylError::from_json_error(e);
    } catch (const std::invalid_argument& e) {
        return TylError::from_json_error(e);
    }
}

std::variant<ErrorContext, TylError> decode_context(const std::string& payload) {
    try {
        return json::parse(payload).get<ErrorContext>();
    } catch (const json::exception& e) {
        return TylError::from_json_error(e);
    } catch (const std::invalid_argument& e) {
        return TylError::from_json_error(e);
    }
}

void log_error_context(const ErrorContext& context, LogLevel level) {
    log_error_context(context, level, ErrorSettings::global());
}

void log_error_context(const ErrorContext& context, LogLevel level, const ErrorSettings& settings) {
    if (!settings.log_errors || level > settings.log_level) {
        return;
    }

    std::string line = context.operation + " failed (category=" + context.category.category_name() +
                       ", attempt=" + std::to_string(context.attempt_count) +
                       ", id=" + context.error_id + "): " + context.message;
    if (!context.metadata.empty()) {
        line += " " + json(context.metadata).dump();
    }
    log_message(level, line);
}

} // namespace tyl
