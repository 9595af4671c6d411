// tyl_error.cpp - error taxonomy, display and classification

#include <stdexcept>
#include <string>
#include "tyl_error.h"
#include "data_logger.h"

namespace tyl {

namespace {

struct DisplayVisitor {
    std::string operator()(const TylError::Database& e) const { return "Database error: " + e.message; }
    std::string operator()(const TylError::Network& e) const { return "Network error: " + e.message; }
    std::string operator()(const TylError::Validation& e) const {
        return "Validation error: " + e.field + ": " + e.message;
    }
    std::string operator()(const TylError::NotFound& e) const {
        return "Not found: " + e.resource + " with id " + e.id;
    }
    std::string operator()(const TylError::Conflict& e) const { return "Conflict: " + e.message; }
    std::string operator()(const TylError::Internal& e) const { return "Internal error: " + e.message; }
    std::string operator()(const TylError::Configuration& e) const {
        return "Configuration error: " + e.message;
    }
    std::string operator()(const TylError::NotImplemented& e) const {
        return "Feature not implemented: " + e.feature;
    }
    std::string operator()(const TylError::Custom& e) const { return "Custom error: " + e.message; }
};

struct CategoryVisitor {
    ErrorCategory operator()(const TylError::Database&) const { return ErrorCategory::transient(); }
    ErrorCategory operator()(const TylError::Network&) const { return ErrorCategory::network(); }
    ErrorCategory operator()(const TylError::Validation&) const { return ErrorCategory::validation(); }
    ErrorCategory operator()(const TylError::NotFound&) const { return ErrorCategory::permanent(); }
    ErrorCategory operator()(const TylError::Conflict&) const { return ErrorCategory::permanent(); }
    ErrorCategory operator()(const TylError::Internal&) const { return ErrorCategory::internal(); }
    ErrorCategory operator()(const TylError::Configuration&) const { return ErrorCategory::permanent(); }
    ErrorCategory operator()(const TylError::NotImplemented&) const { return ErrorCategory::permanent(); }
    ErrorCategory operator()(const TylError::Custom& e) const {
        return ErrorCategory::custom(e.effective_classifier().clone());
    }
};

struct JsonBodyVisitor {
    json operator()(const TylError::Database& e) const { return {{"message", e.message}}; }
    json operator()(const TylError::Network& e) const { return {{"message", e.message}}; }
    json operator()(const TylError::Validation& e) const {
        return {{"field", e.field}, {"message", e.message}};
    }
    json operator()(const TylError::NotFound& e) const {
        return {{"resource", e.resource}, {"id", e.id}};
    }
    json operator()(const TylError::Conflict& e) const { return {{"message", e.message}}; }
    json operator()(const TylError::Internal& e) const { return {{"message", e.message}}; }
    json operator()(const TylError::Configuration& e) const { return {{"message", e.message}}; }
    json operator()(const TylError::NotImplemented& e) const { return {{"feature", e.feature}}; }
    // classifier is behavior, not data
    json operator()(const TylError::Custom& e) const { return {{"message", e.message}}; }
};

} // namespace

TylError::Custom::Custom(std::string message, std::unique_ptr<ErrorClassifier> classifier)
    : message(std::move(message)), classifier(std::move(classifier)) {
    if (!this->classifier) {
        throw std::invalid_argument("custom error requires a non-null classifier");
    }
}

TylError::Custom::Custom(const Custom& other)
    : message(other.message), classifier(other.effective_classifier().clone()) {}

TylError::Custom& TylError::Custom::operator=(const Custom& other) {
    if (this != &other) {
        message = other.message;
        classifier = other.effective_classifier().clone();
    }
    return *this;
}

const ErrorClassifier& TylError::Custom::effective_classifier() const {
    static const BuiltinClassifier unknown(BuiltinCategory::Unknown);
    if (!classifier) {
        return unknown;
    }
    return *classifier;
}

TylError::TylError(Payload payload)
    : value(std::move(payload)),
      display_text(std::visit(DisplayVisitor{}, value)) {}

TylError TylError::database(std::string message) {
    return TylError(Database{std::move(message)});
}

TylError TylError::network(std::string message) {
    return TylError(Network{std::move(message)});
}

TylError TylError::validation(std::string field, std::string message) {
    return TylError(Validation{std::move(field), std::move(message)});
}

TylError TylError::not_found(std::string resource, std::string id) {
    return TylError(NotFound{std::move(resource), std::move(id)});
}

TylError TylError::conflict(std::string message) {
    return TylError(Conflict{std::move(message)});
}

TylError TylError::internal(std::string message) {
    return TylError(Internal{std::move(message)});
}

TylError TylError::configuration(std::string message) {
    return TylError(Configuration{std::move(message)});
}

TylError TylError::not_implemented(std::string feature) {
    return TylError(NotImplemented{std::move(feature)});
}

TylError TylError::custom(std::string message, std::unique_ptr<ErrorClassifier> classifier) {
    return TylError(Custom(std::move(message), std::move(classifier)));
}

TylError TylError::business_logic(std::string message, std::unique_ptr<ErrorClassifier> classifier) {
    return custom(std::move(message), std::move(classifier));
}

TylError TylError::parsing(std::string message) {
    return validation("parsing", std::move(message));
}

TylError TylError::serialization(const std::string& message) {
    return internal("Serialization error: " + message);
}

TylError TylError::connection(const std::string& message) {
    return network("Connection error: " + message);
}

TylError TylError::initialization(const std::string& message) {
    return internal("Initialization error: " + message);
}

TylError TylError::from_json_error(const std::exception& error) {
    return internal("JSON serialization error: " + std::string(error.what()));
}

TylError::Kind TylError::kind() const {
    return static_cast<Kind>(value.index());
}

std::string TylError::kind_name() const {
    return kind_to_string(kind());
}

const char* TylError::what() const noexcept {
    return display_text.c_str();
}

ErrorCategory TylError::category() const {
    return std::visit(CategoryVisitor{}, value);
}

ErrorContext TylError::to_context(std::string operation) const {
    return ErrorContext(std::move(operation), category(), display_text);
}

bool TylError::should_retry(std::size_t attempt) const {
    return should_retry(attempt, ErrorSettings::global());
}

bool TylError::should_retry(std::size_t attempt, const ErrorSettings& settings) const {
    return category().is_retriable() && attempt < settings.max_retries;
}

void TylError::log_if_enabled(LogLevel level) const {
    log_if_enabled(level, ErrorSettings::global());
}

void TylError::log_if_enabled(LogLevel level, const ErrorSettings& settings) const {
    if (settings.log_errors && level <= settings.log_level) {
        log_message(level, display_text);
    }
}

bool TylError::backtrace_enabled() {
    return ErrorSettings::global().backtrace_enabled;
}

std::size_t TylError::max_retries() {
    return ErrorSettings::global().max_retries;
}

bool TylError::log_errors_enabled() {
    return ErrorSettings::global().log_errors;
}

LogLevel TylError::log_level() {
    return ErrorSettings::global().log_level;
}

std::string kind_to_string(TylError::Kind kind) {
    switch (kind) {
        case TylError::Kind::Database: return "Database";
        case TylError::Kind::Network: return "Network";
        case TylError::Kind::Validation: return "Validation";
        case TylError::Kind::NotFound: return "NotFound";
        case TylError::Kind::Conflict: return "Conflict";
        case TylError::Kind::Internal: return "Internal";
        case TylError::Kind::Configuration: return "Configuration";
        case TylError::Kind::NotImplemented: return "NotImplemented";
        case TylError::Kind::Custom: return "Custom";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, const TylError& error) {
    return out << error.to_string();
}

} // namespace tyl

namespace nlohmann {

void adl_serializer<tyl::TylError>::to_json(json& j, const tyl::TylError& error) {
    j = json::object();
    j[error.kind_name()] = std::visit(tyl::JsonBodyVisitor{}, error.payload());
}

tyl::TylError adl_serializer<tyl::TylError>::from_json(const json& j) {
    using tyl::TylError;

    if (!j.is_object() || j.size() != 1) {
        throw std::invalid_argument("TylError must be an object with a single variant tag");
    }

    auto it = j.begin();
    const std::string& tag = it.key();
    const json& body = it.value();

    auto field = [&body](const char* name) {
        return body.at(name).get<std::string>();
    };

    if (tag == "Database") return TylError::database(field("message"));
    if (tag == "Network") return TylError::network(field("message"));
    if (tag == "Validation") return TylError::validation(field("field"), field("message"));
    if (tag == "NotFound") return TylError::not_found(field("resource"), field("id"));
    if (tag == "Conflict") return TylError::conflict(field("message"));
    if (tag == "Internal") return TylError::internal(field("message"));
    if (tag == "Configuration") return TylError::configuration(field("message"));
    if (tag == "NotImplemented") return TylError::not_implemented(field("feature"));
    if (tag == "Custom") return TylError::custom(field("message"), tyl::default_classifier());

    throw std::invalid_argument("unknown TylError variant: " + tag);
}

} // namespace nlohmann
