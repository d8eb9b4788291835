#ifndef SIFT_EXCEPTIONS_H
#define SIFT_EXCEPTIONS_H

#include "ValidationOutcome.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace Sift {

class SiftException : public std::runtime_error {
public:
    explicit SiftException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public SiftException {
public:
    explicit IOException(const std::string& message) : SiftException("IO Error: " + message) {}
};

class ConfigurationException : public SiftException {
public:
    explicit ConfigurationException(const std::string& message) : SiftException("Configuration Error: " + message) {}
};

class EncodingException : public SiftException {
public:
    explicit EncodingException(const std::string& message)
        : SiftException("Encoding Error: " + message), detail_(message) {}

    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

class ValidationException : public SiftException {
public:
    explicit ValidationException(ValidationOutcome outcome)
        : SiftException("Validation Error: " + outcome.rule + ": " + outcome.detail), outcome_(std::move(outcome)) {}

    const ValidationOutcome& outcome() const noexcept { return outcome_; }
    const std::string& rule() const noexcept { return outcome_.rule; }
    const std::string& detail() const noexcept { return outcome_.detail; }

private:
    ValidationOutcome outcome_;
};

} // namespace Sift

#endif // SIFT_EXCEPTIONS_H
