#ifndef TYL_ERROR_HANDLER_H
#define TYL_ERROR_HANDLER_H

#include <chrono>
#include <cstddef>
#include <string>
#include <variant>
#include "error_category.h"
#include "error_context.h"
#include "error_settings.h"
#include "tyl_error.h"

namespace tyl {

// Error analysis functions
bool is_retriable(const ErrorCategory& category);
std::chrono::milliseconds calculate_retry_delay(const ErrorCategory& category, std::size_t attempt);

// Retry decisions for a concrete error, driven by its category and the global max_retries
bool should_retry(const TylError& error, std::size_t attempt);
std::chrono::milliseconds retry_delay(const TylError& error, std::size_t attempt);
std::size_t max_retries(const TylError& error);

// Encoding helpers
std::string encode_error(const TylError& error);
std::string encode_context(const ErrorContext& context);

// Decode a JSON payload. Malformed input never throws: it comes back as an
// Internal error ("JSON serialization error: ...").
TylError decode_error(const std::string& payload);
std::variant<ErrorContext, TylError> decode_context(const std::string& payload);

// One diagnostic line per occurrence, filtered by the settings
void log_error_context(const ErrorContext& context, LogLevel level);
void log_error_context(const ErrorContext& context, LogLevel level, const ErrorSettings& settings);

} // namespace tyl

#endif // TYL_ERROR_HANDLER_H
