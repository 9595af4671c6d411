#ifndef TYL_TEST_HELPERS_H
#define TYL_TEST_HELPERS_H

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include "error_category.h"
#include "data_logger.h"

namespace tyl_test {

// Classifier with fixed, configurable answers.
class FixedClassifier : public tyl::ErrorClassifier {
private:
    bool retriable;
    std::chrono::milliseconds per_attempt;
    std::string name;

public:
    FixedClassifier(bool retriable, std::chrono::milliseconds per_attempt, std::string name)
        : retriable(retriable), per_attempt(per_attempt), name(std::move(name)) {}

    bool is_retriable() const override { return retriable; }
    std::chrono::milliseconds retry_delay(std::size_t attempt) const override {
        return per_attempt * static_cast<long long>(attempt);
    }
    std::string category_name() const override { return name; }
    std::unique_ptr<tyl::ErrorClassifier> clone() const override {
        return std::make_unique<FixedClassifier>(*this);
    }
};

inline std::unique_ptr<tyl::ErrorClassifier> make_classifier(bool retriable,
                                                             std::chrono::milliseconds per_attempt,
                                                             const std::string& name) {
    return std::make_unique<FixedClassifier>(retriable, per_attempt, name);
}

// Captures diagnostic output for the lifetime of the object.
class LogCapture {
private:
    std::ostringstream buffer;

public:
    LogCapture() { tyl::set_log_stream(&buffer); }
    ~LogCapture() { tyl::set_log_stream(nullptr); }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string str() const { return buffer.str(); }
};

inline void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

inline void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

} // namespace tyl_test

#endif // TYL_TEST_HELPERS_H
