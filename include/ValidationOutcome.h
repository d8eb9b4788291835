#pragma once
#include <string>
#include <utility>
#include <vector>

namespace ValidationRule {
inline constexpr const char* kFileTooLarge = "FileTooLarge";
inline constexpr const char* kEmptyFile = "EmptyFile";
inline constexpr const char* kMalformedHeader = "MalformedHeader";
inline constexpr const char* kTooManyRows = "TooManyRows";
inline constexpr const char* kTooManyColumns = "TooManyColumns";
inline constexpr const char* kDuplicateColumn = "DuplicateColumn";
inline constexpr const char* kMalformedRows = "MalformedRows";
inline constexpr const char* kNoValidRows = "NoValidRows";
}

struct ValidationOutcome {
    enum class Status { ACCEPTED, REJECTED };

    Status status = Status::ACCEPTED;
    std::string rule;
    std::string detail;
    // Informational details attached to an accepted file (e.g. excluded malformed rows).
    std::vector<std::string> notes;

    bool accepted() const noexcept { return status == Status::ACCEPTED; }

    static ValidationOutcome accept() { return ValidationOutcome{}; }
    static ValidationOutcome reject(std::string rule, std::string detail) {
        ValidationOutcome out;
        out.status = Status::REJECTED;
        out.rule = std::move(rule);
        out.detail = std::move(detail);
        return out;
    }
};
