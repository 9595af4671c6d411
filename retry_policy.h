#ifndef TYL_RETRY_POLICY_H
#define TYL_RETRY_POLICY_H

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace tyl {

using json = nlohmann::json;

/**
 * Declarative backoff configuration.
 *
 * Independent of ErrorCategory: a policy knows nothing about errors and
 * holds no runtime state. Note the conventions differ from the category
 * backoff: calculate_delay() treats attempt 1 as the first retry, while
 * should_retry() counts attempts from 0.
 */
class RetryPolicy {
private:
    std::size_t attempt_limit = 3;
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds delay_cap{30000};
    double multiplier = 2.0;
    bool use_jitter = true;

public:
    RetryPolicy() = default;

    // Builder style setters, each returns a modified copy
    RetryPolicy with_max_attempts(std::size_t max_attempts) const;
    RetryPolicy with_base_delay(std::chrono::milliseconds base_delay) const;
    RetryPolicy with_max_delay(std::chrono::milliseconds max_delay) const;
    RetryPolicy with_backoff_multiplier(double factor) const;
    RetryPolicy with_jitter(bool jitter) const;

    // Presets
    static RetryPolicy fast();
    static RetryPolicy standard();
    static RetryPolicy slow();
    static RetryPolicy network();
    static RetryPolicy database();

    std::size_t max_attempts() const { return attempt_limit; }
    std::chrono::milliseconds base_delay() const { return initial_delay; }
    std::chrono::milliseconds max_delay() const { return delay_cap; }
    double backoff_multiplier() const { return multiplier; }
    bool jitter() const { return use_jitter; }

    // 0 for attempt 0, otherwise base * multiplier^(attempt-1) capped at max_delay,
    // then scaled by a random factor in [0.75, 1.25) when jitter is on.
    std::chrono::milliseconds calculate_delay(std::size_t attempt) const;

    // Same computation without the random factor.
    std::chrono::milliseconds calculate_base_delay(std::size_t attempt) const;

    bool should_retry(std::size_t attempt) const { return attempt < attempt_limit; }
};

// Scales delay by a factor drawn uniformly from [0.75, 1.25).
std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay);

// Delays are encoded as integer milliseconds.
void to_json(json& j, const RetryPolicy& policy);
void from_json(const json& j, RetryPolicy& policy);

/**
 * Outcome of one attempt of a retried operation: a value, an error worth
 * retrying, or a final error.
 */
template <typename T, typename E>
class RetryResult {
private:
    struct SuccessTag { T value; };
    struct RetryTag { E error; };
    struct FailedTag { E error; };

    std::variant<SuccessTag, RetryTag, FailedTag> state;

    explicit RetryResult(SuccessTag tag) : state(std::move(tag)) {}
    explicit RetryResult(RetryTag tag) : state(std::move(tag)) {}
    explicit RetryResult(FailedTag tag) : state(std::move(tag)) {}

public:
    static RetryResult success(T value) { return RetryResult(SuccessTag{std::move(value)}); }
    static RetryResult retry(E error) { return RetryResult(RetryTag{std::move(error)}); }
    static RetryResult failed(E error) { return RetryResult(FailedTag{std::move(error)}); }

    bool is_success() const { return std::holds_alternative<SuccessTag>(state); }
    bool is_retry() const { return std::holds_alternative<RetryTag>(state); }
    bool is_failed() const { return std::holds_alternative<FailedTag>(state); }

    // Throws std::logic_error when the result holds an error.
    const T& value() const {
        if (const auto* ok = std::get_if<SuccessTag>(&state)) {
            return ok->value;
        }
        throw std::logic_error("RetryResult holds an error, not a value");
    }

    // Throws std::logic_error when the result holds a value.
    const E& error() const {
        if (const auto* pending = std::get_if<RetryTag>(&state)) {
            return pending->error;
        }
        if (const auto* final_error = std::get_if<FailedTag>(&state)) {
            return final_error->error;
        }
        throw std::logic_error("RetryResult holds a value, not an error");
    }
};

} // namespace tyl

#endif // TYL_RETRY_POLICY_H
