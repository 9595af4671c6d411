#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <variant>
#include "error_handler.h"
#include "test_helpers.h"

using std::chrono::milliseconds;
using tyl::ErrorCategory;
using tyl::ErrorContext;
using tyl::ErrorSettings;
using tyl::LogLevel;
using tyl::TylError;

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

const std::string FOLDED_PREFIX = "Internal error: JSON serialization error: ";

} // namespace

TEST_CASE("category helpers delegate to the category", "[handler]") {
    REQUIRE(tyl::is_retriable(ErrorCategory::service_unavailable()));
    REQUIRE_FALSE(tyl::is_retriable(ErrorCategory::authentication()));
    REQUIRE(tyl::calculate_retry_delay(ErrorCategory::network(), 1) == milliseconds(1000));

    ErrorCategory custom = ErrorCategory::custom(tyl_test::make_classifier(true, milliseconds(7), "Seven"));
    REQUIRE(tyl::is_retriable(custom));
    REQUIRE(tyl::calculate_retry_delay(custom, 3) == milliseconds(21));
}

TEST_CASE("error helpers use the error's category and the global budget", "[handler]") {
    TylError database = TylError::database("lock timeout");
    REQUIRE(tyl::retry_delay(database, 1) == milliseconds(200));
    REQUIRE(tyl::max_retries(database) == ErrorSettings::global().max_retries);
    REQUIRE(tyl::should_retry(database, 0) == database.should_retry(0));
    REQUIRE_FALSE(tyl::should_retry(TylError::conflict("m"), 0));
}

TEST_CASE("encode_error produces compact tagged JSON", "[handler][json]") {
    REQUIRE(tyl::encode_error(TylError::network("down")) == R"({"Network":{"message":"down"}})");
}

TEST_CASE("decode_error restores well-formed payloads", "[handler][json]") {
    TylError decoded = tyl::decode_error(tyl::encode_error(TylError::validation("age", "must be positive")));
    REQUIRE(decoded.kind() == TylError::Kind::Validation);
    REQUIRE(decoded.to_string() == "Validation error: age: must be positive");
}

TEST_CASE("decode_error folds every failure into Internal", "[handler][json]") {
    SECTION("syntax error") {
        TylError error = tyl::decode_error("{not json");
        REQUIRE(error.kind() == TylError::Kind::Internal);
        REQUIRE(starts_with(error.to_string(), FOLDED_PREFIX));
    }

    SECTION("unknown variant tag") {
        TylError error = tyl::decode_error(R"({"Meltdown":{"message":"x"}})");
        REQUIRE(error.kind() == TylError::Kind::Internal);
        REQUIRE(error.to_string() == FOLDED_PREFIX + "unknown TylError variant: Meltdown");
    }

    SECTION("missing field") {
        TylError error = tyl::decode_error(R"({"Validation":{"field":"age"}})");
        REQUIRE(error.kind() == TylError::Kind::Internal);
        REQUIRE(starts_with(error.to_string(), FOLDED_PREFIX));
    }

    SECTION("wrong field type") {
        TylError error = tyl::decode_error(R"({"Database":{"message":42}})");
        REQUIRE(error.kind() == TylError::Kind::Internal);
        REQUIRE(starts_with(error.to_string(), FOLDED_PREFIX));
    }
}

TEST_CASE("decode_context returns the context or the folded error", "[handler][json]") {
    ErrorContext context = ErrorContext("sync", ErrorCategory::transient(), "flaky")
        .with_metadata("shard", 3);

    auto decoded = tyl::decode_context(tyl::encode_context(context));
    REQUIRE(std::holds_alternative<ErrorContext>(decoded));
    const ErrorContext& restored = std::get<ErrorContext>(decoded);
    REQUIRE(restored.error_id == context.error_id);
    REQUIRE(restored.category.category_name() == "Transient");
    REQUIRE(*restored.get_metadata("shard") == 3);

    auto missing = tyl::decode_context(R"({"operation":"sync"})");
    REQUIRE(std::holds_alternative<TylError>(missing));
    REQUIRE(starts_with(std::get<TylError>(missing).to_string(), FOLDED_PREFIX));

    auto bad_time = tyl::decode_context(
        R"({"error_id":"x","operation":"o","message":"m","occurred_at":"noon","attempt_count":1})");
    REQUIRE(std::holds_alternative<TylError>(bad_time));
    REQUIRE(std::get<TylError>(bad_time).to_string() == FOLDED_PREFIX + "invalid timestamp: noon");
}

TEST_CASE("log_error_context writes one line per occurrence", "[handler][logging]") {
    ErrorContext context("charge_card", ErrorCategory::service_unavailable(), "gateway down");
    context.increment_attempt();
    ErrorSettings settings(false, 3, true, LogLevel::INFO);

    SECTION("without metadata") {
        tyl_test::LogCapture capture;
        tyl::log_error_context(context, LogLevel::WARN, settings);
        REQUIRE(capture.str() == "[WARN] charge_card failed (category=ServiceUnavailable, attempt=2, id=" +
                                     context.error_id + "): gateway down\n");
    }

    SECTION("with metadata") {
        context.add_metadata("gateway", "acme");
        tyl_test::LogCapture capture;
        tyl::log_error_context(context, LogLevel::ERROR, settings);
        REQUIRE(capture.str() == "[ERROR] charge_card failed (category=ServiceUnavailable, attempt=2, id=" +
                                     context.error_id + "): gateway down {\"gateway\":\"acme\"}\n");
    }

    SECTION("filtered by level and switch") {
        tyl_test::LogCapture capture;
        tyl::log_error_context(context, LogLevel::DEBUG, settings);
        tyl::log_error_context(context, LogLevel::ERROR, ErrorSettings(false, 3, false, LogLevel::DEBUG));
        REQUIRE(capture.str().empty());
    }
}
