#ifndef TYL_ERROR_CATEGORY_H
#define TYL_ERROR_CATEGORY_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace tyl {

using json = nlohmann::json;

/**
 * Capability set every error category provides.
 *
 * Implement this to add a domain-specific category without touching the
 * library. Implementations are shared between threads and must not carry
 * mutable state.
 */
class ErrorClassifier {
public:
    virtual ~ErrorClassifier() = default;

    // Whether an error of this category should trigger a retry.
    virtual bool is_retriable() const = 0;

    // Suggested wait before retry number `attempt` (1-based).
    virtual std::chrono::milliseconds retry_delay(std::size_t attempt) const = 0;

    // Stable name used to group errors in logs and telemetry.
    virtual std::string category_name() const = 0;

    virtual std::unique_ptr<ErrorClassifier> clone() const = 0;
};

enum class BuiltinCategory {
    Transient,           // temporary failures, short delays
    Permanent,           // never retried
    ResourceExhaustion,  // retried after long delays
    Network,
    Authentication,
    Validation,
    Internal,
    ServiceUnavailable,  // 503-style
    Unknown              // fallback
};

std::string builtin_category_name(BuiltinCategory category);
std::optional<BuiltinCategory> builtin_category_from_name(const std::string& name);

bool builtin_is_retriable(BuiltinCategory category);
std::chrono::milliseconds builtin_base_delay(BuiltinCategory category);

// base_delay * min(2^min(attempt, 10), 60)
std::chrono::milliseconds builtin_retry_delay(BuiltinCategory category, std::size_t attempt);

// ErrorClassifier view of a built-in category.
class BuiltinClassifier : public ErrorClassifier {
private:
    BuiltinCategory category;

public:
    explicit BuiltinClassifier(BuiltinCategory category);

    BuiltinCategory builtin() const { return category; }

    bool is_retriable() const override;
    std::chrono::milliseconds retry_delay(std::size_t attempt) const override;
    std::string category_name() const override;
    std::unique_ptr<ErrorClassifier> clone() const override;
};

// Classifier substituted for custom classifiers lost in deserialization.
std::unique_ptr<ErrorClassifier> default_classifier();

/**
 * A built-in category or a caller supplied classifier.
 *
 * Both alternatives answer the same three questions; callers never need to
 * know which one they hold. Copies deep-clone the custom classifier.
 */
class ErrorCategory {
private:
    std::variant<BuiltinCategory, std::unique_ptr<ErrorClassifier>> value;

public:
    explicit ErrorCategory(BuiltinCategory category);
    // Throws std::invalid_argument on a null classifier.
    explicit ErrorCategory(std::unique_ptr<ErrorClassifier> classifier);

    ErrorCategory(const ErrorCategory& other);
    ErrorCategory& operator=(const ErrorCategory& other);
    // A moved-from category is left as BuiltinCategory::Unknown.
    ErrorCategory(ErrorCategory&& other) noexcept;
    ErrorCategory& operator=(ErrorCategory&& other) noexcept;

    static ErrorCategory transient();
    static ErrorCategory permanent();
    static ErrorCategory resource_exhaustion();
    static ErrorCategory network();
    static ErrorCategory authentication();
    static ErrorCategory validation();
    static ErrorCategory internal();
    static ErrorCategory service_unavailable();
    static ErrorCategory unknown();
    static ErrorCategory custom(std::unique_ptr<ErrorClassifier> classifier);

    bool is_retriable() const;
    std::chrono::milliseconds retry_delay(std::size_t attempt) const;
    std::string category_name() const;

    bool is_builtin() const;
    bool is_custom() const;
    std::optional<BuiltinCategory> builtin() const;

    // nullptr for built-in categories
    const ErrorClassifier* classifier() const;
};

void to_json(json& j, const BuiltinCategory& category);
void from_json(const json& j, BuiltinCategory& category);

} // namespace tyl

#endif // TYL_ERROR_CATEGORY_H
