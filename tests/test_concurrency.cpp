#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>
#include "tyl_errors.h"
#include "test_helpers.h"

using std::chrono::milliseconds;
using tyl::ErrorSettings;
using tyl::TylError;

namespace {

const std::size_t THREAD_COUNT = 16;

struct ThreadObservation {
    const ErrorSettings* settings = nullptr;
    std::string category_name;
    bool retriable = false;
    std::vector<milliseconds> delays;
};

} // namespace

// Each test case runs in its own process under ctest, so the threads below
// race on the very first call to ErrorSettings::global().
TEST_CASE("concurrent first access sees a single settings instance", "[settings][threads]") {
    std::atomic<bool> start{false};
    std::vector<const ErrorSettings*> seen(THREAD_COUNT, nullptr);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < THREAD_COUNT; i++) {
        threads.emplace_back([&start, &seen, i]() {
            while (!start.load()) {
                std::this_thread::yield();
            }
            seen[i] = &ErrorSettings::global();
        });
    }
    start.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    const ErrorSettings* expected = &ErrorSettings::global();
    for (const ErrorSettings* settings : seen) {
        REQUIRE(settings == expected);
    }
}

TEST_CASE("a shared error answers identically on every thread", "[error][threads]") {
    const TylError shared = TylError::custom("rate limited",
                                             tyl_test::make_classifier(true, milliseconds(40), "RateLimit"));
    const tyl::ErrorCategory shared_category = TylError::network("m").category();

    std::atomic<bool> start{false};
    std::vector<ThreadObservation> observations(THREAD_COUNT);
    std::vector<std::vector<milliseconds>> builtin_delays(THREAD_COUNT);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < THREAD_COUNT; i++) {
        threads.emplace_back([&, i]() {
            while (!start.load()) {
                std::this_thread::yield();
            }
            ThreadObservation& out = observations[i];
            out.settings = &ErrorSettings::global();
            for (int round = 0; round < 200; round++) {
                tyl::ErrorCategory category = shared.category();
                out.category_name = category.category_name();
                out.retriable = category.is_retriable();
            }
            for (std::size_t attempt = 1; attempt <= 10; attempt++) {
                out.delays.push_back(shared.category().retry_delay(attempt));
                builtin_delays[i].push_back(shared_category.retry_delay(attempt));
            }
        });
    }
    start.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    for (std::size_t i = 0; i < THREAD_COUNT; i++) {
        const ThreadObservation& out = observations[i];
        REQUIRE(out.settings == &ErrorSettings::global());
        REQUIRE(out.category_name == "RateLimit");
        REQUIRE(out.retriable);
        REQUIRE(out.delays.size() == 10);
        for (std::size_t attempt = 1; attempt <= 10; attempt++) {
            REQUIRE(out.delays[attempt - 1] == milliseconds(40) * static_cast<long long>(attempt));
            REQUIRE(builtin_delays[i][attempt - 1] == builtin_delays[0][attempt - 1]);
        }
    }
    REQUIRE(builtin_delays[0][5] == milliseconds(30000));
}
