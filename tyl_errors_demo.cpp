// tyl_errors_demo.cpp - walk through classification, contexts and retry policies

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <chrono>
#include <nlohmann/json.hpp>
#include "tyl_errors.h"

using namespace tyl;

// Payment failures may be temporary, back off 5s per attempt
class PaymentProcessingClassifier : public ErrorClassifier {
public:
    bool is_retriable() const override { return true; }
    std::chrono::milliseconds retry_delay(std::size_t attempt) const override {
        return std::chrono::seconds(5) * static_cast<long long>(attempt);
    }
    std::string category_name() const override { return "PaymentProcessing"; }
    std::unique_ptr<ErrorClassifier> clone() const override {
        return std::make_unique<PaymentProcessingClassifier>(*this);
    }
};

// Business rule violations are permanent
class BusinessRuleClassifier : public ErrorClassifier {
public:
    bool is_retriable() const override { return false; }
    std::chrono::milliseconds retry_delay(std::size_t) const override { return std::chrono::milliseconds(0); }
    std::string category_name() const override { return "BusinessRuleViolation"; }
    std::unique_ptr<ErrorClassifier> clone() const override {
        return std::make_unique<BusinessRuleClassifier>(*this);
    }
};

static void print_error(const TylError& error) {
    ErrorCategory category = error.category();
    std::cout << "Error: " << error
              << " | Category: " << category.category_name()
              << " | Retriable: " << (category.is_retriable() ? "yes" : "no")
              << " | Delay(1): " << category.retry_delay(1).count() << "ms" << std::endl;
}

static void builtin_categories_example() {
    std::cout << "\n=== Built-in categories ===" << std::endl;

    std::vector<TylError> errors = {
        TylError::database("Connection timeout"),
        TylError::network("Service unavailable"),
        TylError::validation("email", "Invalid format"),
        TylError::not_found("user", "123"),
        TylError::connection("refused by upstream"),
        TylError::parsing("unexpected token")
    };

    for (const auto& error : errors) {
        print_error(error);
    }
}

static void custom_categories_example() {
    std::cout << "\n=== Custom categories ===" << std::endl;

    TylError payment = TylError::custom("Card declined by processor",
                                        std::make_unique<PaymentProcessingClassifier>());
    TylError rule = TylError::custom("Order total exceeds credit limit",
                                     std::make_unique<BusinessRuleClassifier>());
    print_error(payment);
    print_error(rule);

    // Classifiers are not serialized, the decoded error falls back to Unknown
    TylError decoded = decode_error(encode_error(payment));
    std::cout << "Round trip: " << encode_error(payment)
              << " -> category " << decoded.category().category_name() << std::endl;
}

static void error_context_example() {
    std::cout << "\n=== Error context ===" << std::endl;

    ErrorContext context = TylError::network("Connection reset")
        .to_context("fetch_user_profile")
        .with_metadata("endpoint", "/api/users/42")
        .with_metadata("timeout_ms", 5000);

    context.increment_attempt();
    context.add_metadata("region", "eu-west-1");

    log_error_context(context, LogLevel::WARN);
    std::cout << json(context).dump(2) << std::endl;
}

static void retry_policy_example() {
    std::cout << "\n=== Retry policies ===" << std::endl;

    std::vector<std::pair<std::string, RetryPolicy>> policies = {
        {"fast", RetryPolicy::fast()},
        {"standard", RetryPolicy::standard()},
        {"slow", RetryPolicy::slow()},
        {"network", RetryPolicy::network()},
        {"database", RetryPolicy::database()}
    };

    for (const auto& [name, policy] : policies) {
        std::cout << name << ":";
        for (std::size_t attempt = 1; attempt <= policy.max_attempts(); attempt++) {
            std::cout << " " << policy.calculate_base_delay(attempt).count() << "ms"
                      << " (~" << policy.calculate_delay(attempt).count() << "ms)";
        }
        std::cout << std::endl;
    }
}

// Stands in for a remote call: fails three times, then succeeds
static RetryResult<std::string, TylError> simulate_network_call(std::size_t attempt) {
    if (attempt < 3) {
        return RetryResult<std::string, TylError>::retry(TylError::network("Connection timeout"));
    }
    if (attempt == 3) {
        return RetryResult<std::string, TylError>::retry(TylError::network("Service temporarily unavailable"));
    }
    return RetryResult<std::string, TylError>::success("Data retrieved successfully");
}

static void retry_decision_example() {
    std::cout << "\n=== Retry decisions ===" << std::endl;

    RetryPolicy policy = RetryPolicy::network();
    for (std::size_t attempt = 0; policy.should_retry(attempt); attempt++) {
        auto result = simulate_network_call(attempt + 1);
        if (result.is_success()) {
            std::cout << "Success on attempt " << attempt + 1 << ": " << result.value() << std::endl;
            return;
        }

        const TylError& error = result.error();
        if (!error.category().is_retriable()) {
            std::cout << "Non-retriable error: " << error << std::endl;
            return;
        }

        // The caller owns the waiting; this only reports what it would be
        std::cout << "Attempt " << attempt + 1 << " failed: " << error
                  << " (category delay " << error.category().retry_delay(attempt + 1).count() << "ms"
                  << ", policy delay " << policy.calculate_delay(attempt + 1).count() << "ms)" << std::endl;
    }
    std::cout << "Max attempts reached" << std::endl;
}

int main() {
    std::cout << "============================\n";
    std::cout << "  tyl_errors demo\n";
    std::cout << "============================" << std::endl;

    const ErrorSettings& settings = ErrorSettings::global();
    std::cout << "max_retries=" << settings.max_retries
              << " log_errors=" << (settings.log_errors ? "true" : "false")
              << " log_level=" << level_to_string(settings.log_level) << std::endl;

    try {
        builtin_categories_example();
        custom_categories_example();
        error_context_example();
        retry_policy_example();
        retry_decision_example();
    } catch (const std::exception& e) {
        log_error("Demo failed: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
