// retry_policy.cpp - configurable exponential backoff

#include <cmath>
#include <limits>
#include <random>
#include "retry_policy.h"

namespace tyl {

using std::chrono::milliseconds;

RetryPolicy RetryPolicy::with_max_attempts(std::size_t max_attempts) const {
    RetryPolicy policy = *this;
    policy.attempt_limit = max_attempts;
    return policy;
}

RetryPolicy RetryPolicy::with_base_delay(milliseconds base_delay) const {
    RetryPolicy policy = *this;
    policy.initial_delay = base_delay;
    return policy;
}

RetryPolicy RetryPolicy::with_max_delay(milliseconds max_delay) const {
    RetryPolicy policy = *this;
    policy.delay_cap = max_delay;
    return policy;
}

RetryPolicy RetryPolicy::with_backoff_multiplier(double factor) const {
    RetryPolicy policy = *this;
    policy.multiplier = factor;
    return policy;
}

RetryPolicy RetryPolicy::with_jitter(bool jitter) const {
    RetryPolicy policy = *this;
    policy.use_jitter = jitter;
    return policy;
}

// Quick operations: 3 attempts, 50ms base, 1s cap, x1.5
RetryPolicy RetryPolicy::fast() {
    return RetryPolicy()
        .with_max_attempts(3)
        .with_base_delay(milliseconds(50))
        .with_max_delay(milliseconds(1000))
        .with_backoff_multiplier(1.5);
}

RetryPolicy RetryPolicy::standard() {
    return RetryPolicy();
}

// Expensive operations: 5 attempts, 500ms base, 60s cap, x2
RetryPolicy RetryPolicy::slow() {
    return RetryPolicy()
        .with_max_attempts(5)
        .with_base_delay(milliseconds(500))
        .with_max_delay(milliseconds(60000))
        .with_backoff_multiplier(2.0);
}

// 4 attempts, 250ms base, 30s cap, x2
RetryPolicy RetryPolicy::network() {
    return RetryPolicy()
        .with_max_attempts(4)
        .with_base_delay(milliseconds(250))
        .with_max_delay(milliseconds(30000))
        .with_backoff_multiplier(2.0);
}

// 3 attempts, 100ms base, 10s cap, x2
RetryPolicy RetryPolicy::database() {
    return RetryPolicy()
        .with_max_attempts(3)
        .with_base_delay(milliseconds(100))
        .with_max_delay(milliseconds(10000))
        .with_backoff_multiplier(2.0);
}

milliseconds RetryPolicy::calculate_base_delay(std::size_t attempt) const {
    if (attempt == 0) {
        return milliseconds(0);
    }

    double exponential = static_cast<double>(initial_delay.count()) *
                         std::pow(multiplier, static_cast<double>(attempt - 1));

    // Saturate at the cap before converting so huge attempts cannot overflow
    if (!std::isfinite(exponential) || exponential >= static_cast<double>(delay_cap.count())) {
        return delay_cap;
    }
    if (exponential <= 0.0) {
        return milliseconds(0);
    }
    return milliseconds(static_cast<milliseconds::rep>(exponential));
}

milliseconds RetryPolicy::calculate_delay(std::size_t attempt) const {
    milliseconds delay = calculate_base_delay(attempt);
    if (use_jitter && delay.count() > 0) {
        delay = apply_jitter(delay);
    }
    return delay;
}

milliseconds apply_jitter(milliseconds delay) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.75, 1.25);

    double jittered = static_cast<double>(delay.count()) * dist(rng);
    const double limit = static_cast<double>(std::numeric_limits<milliseconds::rep>::max());
    if (jittered >= limit) {
        return milliseconds::max();
    }
    return milliseconds(static_cast<milliseconds::rep>(jittered));
}

void to_json(json& j, const RetryPolicy& policy) {
    j = json{
        {"max_attempts", policy.max_attempts()},
        {"base_delay_ms", policy.base_delay().count()},
        {"max_delay_ms", policy.max_delay().count()},
        {"backoff_multiplier", policy.backoff_multiplier()},
        {"jitter", policy.jitter()}
    };
}

// Missing keys keep the defaults
void from_json(const json& j, RetryPolicy& policy) {
    RetryPolicy defaults;
    policy = defaults
        .with_max_attempts(j.value("max_attempts", defaults.max_attempts()))
        .with_base_delay(milliseconds(j.value("base_delay_ms", defaults.base_delay().count())))
        .with_max_delay(milliseconds(j.value("max_delay_ms", defaults.max_delay().count())))
        .with_backoff_multiplier(j.value("backoff_multiplier", defaults.backoff_multiplier()))
        .with_jitter(j.value("jitter", defaults.jitter()));
}

} // namespace tyl
