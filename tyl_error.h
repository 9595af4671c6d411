#ifndef TYL_ERROR_H
#define TYL_ERROR_H

#include <cstddef>
#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "error_category.h"
#include "error_context.h"
#include "error_settings.h"

namespace tyl {

/**
 * The library's error value.
 *
 * A closed set of nine variants. Each variant has a fixed display template
 * and maps to exactly one category; Custom carries its own classifier.
 * Values are immutable once built and copy cheaply (Custom clones its
 * classifier). Derives from std::exception so callers may throw it, but the
 * library only ever returns it.
 */
class TylError : public std::exception {
public:
    enum class Kind {
        Database,
        Network,
        Validation,
        NotFound,
        Conflict,
        Internal,
        Configuration,
        NotImplemented,
        Custom
    };

    struct Database { std::string message; };
    struct Network { std::string message; };
    struct Validation { std::string field; std::string message; };
    struct NotFound { std::string resource; std::string id; };
    struct Conflict { std::string message; };
    struct Internal { std::string message; };
    struct Configuration { std::string message; };
    struct NotImplemented { std::string feature; };

    struct Custom {
        std::string message;
        std::unique_ptr<ErrorClassifier> classifier;

        Custom(std::string message, std::unique_ptr<ErrorClassifier> classifier);
        Custom(const Custom& other);
        Custom& operator=(const Custom& other);
        Custom(Custom&&) noexcept = default;
        Custom& operator=(Custom&&) noexcept = default;

        // The held classifier, or the Unknown classifier once moved from.
        const ErrorClassifier& effective_classifier() const;
    };

    // Alternative order matches Kind.
    using Payload = std::variant<Database, Network, Validation, NotFound, Conflict,
                                 Internal, Configuration, NotImplemented, Custom>;

private:
    Payload value;
    std::string display_text;

    explicit TylError(Payload payload);

public:
    // Primary constructors
    static TylError database(std::string message);
    static TylError network(std::string message);
    static TylError validation(std::string field, std::string message);
    static TylError not_found(std::string resource, std::string id);
    static TylError conflict(std::string message);
    static TylError internal(std::string message);
    static TylError configuration(std::string message);
    static TylError not_implemented(std::string feature);
    // Throws std::invalid_argument on a null classifier.
    static TylError custom(std::string message, std::unique_ptr<ErrorClassifier> classifier);
    static TylError business_logic(std::string message, std::unique_ptr<ErrorClassifier> classifier);

    // Convenience constructors
    static TylError parsing(std::string message);
    static TylError serialization(const std::string& message);
    static TylError connection(const std::string& message);
    static TylError initialization(const std::string& message);

    // Folds any codec failure into Internal.
    static TylError from_json_error(const std::exception& error);

    Kind kind() const;
    std::string kind_name() const;
    const Payload& payload() const { return value; }

    template <typename T>
    const T* get_if() const { return std::get_if<T>(&value); }

    const std::string& to_string() const { return display_text; }
    const char* what() const noexcept override;

    ErrorCategory category() const;
    ErrorContext to_context(std::string operation) const;

    // category().is_retriable() && attempt < max_retries
    bool should_retry(std::size_t attempt) const;
    bool should_retry(std::size_t attempt, const ErrorSettings& settings) const;

    // Writes "[LEVEL] <display>" when logging is enabled and level passes the filter.
    void log_if_enabled(LogLevel level) const;
    void log_if_enabled(LogLevel level, const ErrorSettings& settings) const;

    // Global settings
    static bool backtrace_enabled();
    static std::size_t max_retries();
    static bool log_errors_enabled();
    static LogLevel log_level();
};

std::string kind_to_string(TylError::Kind kind);

std::ostream& operator<<(std::ostream& out, const TylError& error);

} // namespace tyl

namespace nlohmann {

// Externally tagged: {"NotFound": {"resource": "...", "id": "..."}}.
// The Custom classifier is not encoded; decoding substitutes default_classifier().
template <>
struct adl_serializer<tyl::TylError> {
    static void to_json(json& j, const tyl::TylError& error);
    static tyl::TylError from_json(const json& j);
};

} // namespace nlohmann

#endif // TYL_ERROR_H
