// error_category.cpp - built-in categories and custom classifier dispatch

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include "error_category.h"

namespace tyl {

// Exponent is clamped before shifting so large attempts cannot overflow.
static const std::size_t MAX_BACKOFF_EXPONENT = 10;
static const std::uint64_t MAX_BACKOFF_MULTIPLIER = 60;

static const std::unordered_map<std::string, BuiltinCategory> CATEGORY_BY_NAME = {
    {"Transient", BuiltinCategory::Transient},
    {"Permanent", BuiltinCategory::Permanent},
    {"ResourceExhaustion", BuiltinCategory::ResourceExhaustion},
    {"Network", BuiltinCategory::Network},
    {"Authentication", BuiltinCategory::Authentication},
    {"Validation", BuiltinCategory::Validation},
    {"Internal", BuiltinCategory::Internal},
    {"ServiceUnavailable", BuiltinCategory::ServiceUnavailable},
    {"Unknown", BuiltinCategory::Unknown}
};

std::string builtin_category_name(BuiltinCategory category) {
    switch (category) {
        case BuiltinCategory::Transient: return "Transient";
        case BuiltinCategory::Permanent: return "Permanent";
        case BuiltinCategory::ResourceExhaustion: return "ResourceExhaustion";
        case BuiltinCategory::Network: return "Network";
        case BuiltinCategory::Authentication: return "Authentication";
        case BuiltinCategory::Validation: return "Validation";
        case BuiltinCategory::Internal: return "Internal";
        case BuiltinCategory::ServiceUnavailable: return "ServiceUnavailable";
        case BuiltinCategory::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<BuiltinCategory> builtin_category_from_name(const std::string& name) {
    auto it = CATEGORY_BY_NAME.find(name);
    if (it == CATEGORY_BY_NAME.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool builtin_is_retriable(BuiltinCategory category) {
    switch (category) {
        case BuiltinCategory::Transient:
        case BuiltinCategory::Network:
        case BuiltinCategory::ServiceUnavailable:
        case BuiltinCategory::ResourceExhaustion:
            return true;
        default:
            return false;
    }
}

std::chrono::milliseconds builtin_base_delay(BuiltinCategory category) {
    switch (category) {
        case BuiltinCategory::Transient: return std::chrono::milliseconds(100);
        case BuiltinCategory::Network: return std::chrono::milliseconds(500);
        case BuiltinCategory::ServiceUnavailable: return std::chrono::milliseconds(1000);
        case BuiltinCategory::ResourceExhaustion: return std::chrono::milliseconds(5000);
        default: return std::chrono::milliseconds(100);
    }
}

std::chrono::milliseconds builtin_retry_delay(BuiltinCategory category, std::size_t attempt) {
    std::size_t exponent = std::min(attempt, MAX_BACKOFF_EXPONENT);
    std::uint64_t multiplier = std::min(std::uint64_t{1} << exponent, MAX_BACKOFF_MULTIPLIER);
    return builtin_base_delay(category) * static_cast<std::chrono::milliseconds::rep>(multiplier);
}

BuiltinClassifier::BuiltinClassifier(BuiltinCategory category) : category(category) {}

bool BuiltinClassifier::is_retriable() const {
    return builtin_is_retriable(category);
}

std::chrono::milliseconds BuiltinClassifier::retry_delay(std::size_t attempt) const {
    return builtin_retry_delay(category, attempt);
}

std::string BuiltinClassifier::category_name() const {
    return builtin_category_name(category);
}

std::unique_ptr<ErrorClassifier> BuiltinClassifier::clone() const {
    return std::make_unique<BuiltinClassifier>(category);
}

std::unique_ptr<ErrorClassifier> default_classifier() {
    return std::make_unique<BuiltinClassifier>(BuiltinCategory::Unknown);
}

// ErrorCategory implementation

ErrorCategory::ErrorCategory(BuiltinCategory category) : value(category) {}

ErrorCategory::ErrorCategory(std::unique_ptr<ErrorClassifier> classifier) {
    if (!classifier) {
        throw std::invalid_argument("ErrorCategory requires a non-null classifier");
    }
    value = std::move(classifier);
}

ErrorCategory::ErrorCategory(const ErrorCategory& other) {
    if (const auto* builtin = std::get_if<BuiltinCategory>(&other.value)) {
        value = *builtin;
    } else {
        value = std::get<std::unique_ptr<ErrorClassifier>>(other.value)->clone();
    }
}

ErrorCategory& ErrorCategory::operator=(const ErrorCategory& other) {
    if (this != &other) {
        ErrorCategory copy(other);
        value = std::move(copy.value);
    }
    return *this;
}

ErrorCategory::ErrorCategory(ErrorCategory&& other) noexcept : value(std::move(other.value)) {
    other.value = BuiltinCategory::Unknown;
}

ErrorCategory& ErrorCategory::operator=(ErrorCategory&& other) noexcept {
    if (this != &other) {
        value = std::move(other.value);
        other.value = BuiltinCategory::Unknown;
    }
    return *this;
}

ErrorCategory ErrorCategory::transient() { return ErrorCategory(BuiltinCategory::Transient); }
ErrorCategory ErrorCategory::permanent() { return ErrorCategory(BuiltinCategory::Permanent); }
ErrorCategory ErrorCategory::resource_exhaustion() { return ErrorCategory(BuiltinCategory::ResourceExhaustion); }
ErrorCategory ErrorCategory::network() { return ErrorCategory(BuiltinCategory::Network); }
ErrorCategory ErrorCategory::authentication() { return ErrorCategory(BuiltinCategory::Authentication); }
ErrorCategory ErrorCategory::validation() { return ErrorCategory(BuiltinCategory::Validation); }
ErrorCategory ErrorCategory::internal() { return ErrorCategory(BuiltinCategory::Internal); }
ErrorCategory ErrorCategory::service_unavailable() { return ErrorCategory(BuiltinCategory::ServiceUnavailable); }
ErrorCategory ErrorCategory::unknown() { return ErrorCategory(BuiltinCategory::Unknown); }

ErrorCategory ErrorCategory::custom(std::unique_ptr<ErrorClassifier> classifier) {
    return ErrorCategory(std::move(classifier));
}

bool ErrorCategory::is_retriable() const {
    if (const auto* builtin = std::get_if<BuiltinCategory>(&value)) {
        return builtin_is_retriable(*builtin);
    }
    return std::get<std::unique_ptr<ErrorClassifier>>(value)->is_retriable();
}

std::chrono::milliseconds ErrorCategory::retry_delay(std::size_t attempt) const {
    if (const auto* builtin = std::get_if<BuiltinCategory>(&value)) {
        return builtin_retry_delay(*builtin, attempt);
    }
    return std::get<std::unique_ptr<ErrorClassifier>>(value)->retry_delay(attempt);
}

std::string ErrorCategory::category_name() const {
    if (const auto* builtin = std::get_if<BuiltinCategory>(&value)) {
        return builtin_category_name(*builtin);
    }
    return std::get<std::unique_ptr<ErrorClassifier>>(value)->category_name();
}

bool ErrorCategory::is_builtin() const {
    return std::holds_alternative<BuiltinCategory>(value);
}

bool ErrorCategory::is_custom() const {
    return !is_builtin();
}

std::optional<BuiltinCategory> ErrorCategory::builtin() const {
    if (const auto* builtin = std::get_if<BuiltinCategory>(&value)) {
        return *builtin;
    }
    return std::nullopt;
}

const ErrorClassifier* ErrorCategory::classifier() const {
    if (const auto* custom = std::get_if<std::unique_ptr<ErrorClassifier>>(&value)) {
        return custom->get();
    }
    return nullptr;
}

// JSON conversion

void to_json(json& j, const BuiltinCategory& category) {
    j = builtin_category_name(category);
}

// Names outside the built-in set (custom categories) decode as Unknown.
void from_json(const json& j, BuiltinCategory& category) {
    category = builtin_category_from_name(j.get<std::string>()).value_or(BuiltinCategory::Unknown);
}

} // namespace tyl
