// error_context.cpp - error occurrence tracking

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/rand.h>
#include "error_context.h"

namespace tyl {

std::string generate_error_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating error id");
    }

    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::stringstream ss;
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)bytes[i];
    }
    return ss.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    if (seconds > time) {
        seconds -= std::chrono::seconds(1);
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time - seconds).count();

    std::time_t time_t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &time_t);
#else
    gmtime_r(&time_t, &utc);
#endif

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << micros << "Z";
    return ss.str();
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        throw std::invalid_argument("invalid timestamp: " + text);
    }

    // Optional fraction, up to microsecond precision
    long long micros = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            char c = static_cast<char>(in.get());
            if (digits < 6) {
                micros = micros * 10 + (c - '0');
                digits++;
            }
        }
        if (digits == 0) {
            throw std::invalid_argument("invalid timestamp fraction: " + text);
        }
        for (; digits < 6; digits++) {
            micros *= 10;
        }
    }

    if (in.get() != 'Z' || in.peek() != std::char_traits<char>::eof()) {
        throw std::invalid_argument("timestamp must be UTC (trailing Z): " + text);
    }

#if defined(_WIN32)
    std::time_t seconds = _mkgmtime(&utc);
#else
    std::time_t seconds = timegm(&utc);
#endif
    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros));
}

ErrorContext::ErrorContext(std::string operation, ErrorCategory category, std::string message)
    : error_id(generate_error_id()),
      operation(std::move(operation)),
      category(std::move(category)),
      message(std::move(message)),
      occurred_at(std::chrono::system_clock::now()),
      attempt_count(1) {}

ErrorContext& ErrorContext::with_metadata(const std::string& key, json value) & {
    add_metadata(key, std::move(value));
    return *this;
}

ErrorContext ErrorContext::with_metadata(const std::string& key, json value) && {
    add_metadata(key, std::move(value));
    return std::move(*this);
}

void ErrorContext::add_metadata(const std::string& key, json value) {
    metadata[key] = std::move(value);
}

const json* ErrorContext::get_metadata(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ErrorContext::has_metadata(const std::string& key) const {
    return metadata.find(key) != metadata.end();
}

bool ErrorContext::remove_metadata(const std::string& key) {
    return metadata.erase(key) > 0;
}

void ErrorContext::clear_metadata() {
    metadata.clear();
}

std::size_t ErrorContext::metadata_count() const {
    return metadata.size();
}

void ErrorContext::increment_attempt() {
    attempt_count++;
}

} // namespace tyl

namespace nlohmann {

void adl_serializer<tyl::ErrorContext>::to_json(json& j, const tyl::ErrorContext& context) {
    j = json{
        {"error_id", context.error_id},
        {"operation", context.operation},
        {"category", context.category.category_name()},
        {"message", context.message},
        {"occurred_at", tyl::format_timestamp(context.occurred_at)},
        {"attempt_count", context.attempt_count},
        {"metadata", context.metadata}
    };
}

// Custom category names cannot be resolved and come back as Unknown.
tyl::ErrorContext adl_serializer<tyl::ErrorContext>::from_json(const json& j) {
    tyl::BuiltinCategory builtin = tyl::BuiltinCategory::Unknown;
    if (j.contains("category")) {
        builtin = j.at("category").get<tyl::BuiltinCategory>();
    }

    tyl::ErrorContext context(j.at("operation").get<std::string>(),
                              tyl::ErrorCategory(builtin),
                              j.at("message").get<std::string>());
    context.error_id = j.at("error_id").get<std::string>();
    context.occurred_at = tyl::parse_timestamp(j.at("occurred_at").get<std::string>());
    const json& attempts = j.at("attempt_count");
    if (!attempts.is_number_integer() ||
        (!attempts.is_number_unsigned() && attempts.get<long long>() < 0)) {
        throw std::invalid_argument("attempt_count must be a non-negative integer");
    }
    context.attempt_count = attempts.get<std::size_t>();
    if (j.contains("metadata")) {
        context.metadata = j.at("metadata").get<std::map<std::string, json>>();
    }
    return context;
}

} // namespace nlohmann
