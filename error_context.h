#ifndef TYL_ERROR_CONTEXT_H
#define TYL_ERROR_CONTEXT_H

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "error_category.h"

namespace tyl {

// Random (version 4) UUID in canonical 8-4-4-4-12 form.
// Throws std::runtime_error if the OpenSSL generator fails.
std::string generate_error_id();

// RFC 3339 UTC with microseconds, e.g. 2024-05-01T12:34:56.123456Z
std::string format_timestamp(std::chrono::system_clock::time_point time);
// Throws std::invalid_argument on malformed input.
std::chrono::system_clock::time_point parse_timestamp(const std::string& text);

/**
 * One occurrence of an error, for monitoring and debugging.
 *
 * The category is a snapshot taken when the context is created. Metadata keys
 * are unique and the last write wins. Not synchronized: a context has a single
 * owner.
 */
struct ErrorContext {
    std::string error_id;
    std::string operation;
    ErrorCategory category;
    std::string message;
    std::chrono::system_clock::time_point occurred_at;
    std::size_t attempt_count;
    std::map<std::string, json> metadata;

    ErrorContext(std::string operation, ErrorCategory category, std::string message);

    ErrorContext& with_metadata(const std::string& key, json value) &;
    ErrorContext with_metadata(const std::string& key, json value) &&;
    void add_metadata(const std::string& key, json value);

    // nullptr when the key is absent
    const json* get_metadata(const std::string& key) const;
    bool has_metadata(const std::string& key) const;
    bool remove_metadata(const std::string& key);
    void clear_metadata();
    std::size_t metadata_count() const;

    // Called each time the operation is retried. Not bounded here.
    void increment_attempt();
};

} // namespace tyl

namespace nlohmann {

// ErrorContext has no default constructor, so it gets a full serializer.
template <>
struct adl_serializer<tyl::ErrorContext> {
    static void to_json(json& j, const tyl::ErrorContext& context);
    static tyl::ErrorContext from_json(const json& j);
};

} // namespace nlohmann

#endif // TYL_ERROR_CONTEXT_H
