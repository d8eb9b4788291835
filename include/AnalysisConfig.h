#pragma once
#include "CSVUtils.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

struct AnalysisLimits {
    size_t maxBytes = 10 * 1024 * 1024;   // 10 MiB
    size_t maxRows = 1000000;
    size_t maxColumns = 100;
    size_t previewSize = 5;
};

enum class MalformedRowPolicy {
    EXCLUDE,   // skip for inference/statistics, report the count
    REJECT     // any malformed row rejects the file
};

struct InferenceConfig {
    // Each pair is {truthy token, falsy token}; matching is case-insensitive.
    std::vector<std::pair<std::string, std::string>> booleanTokens = {
        {"true", "false"},
        {"yes", "no"},
        {"1", "0"},
    };
    // Tried in order; the first matching pattern wins.
    std::vector<std::string> datePatterns = {
        "%Y-%m-%d",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%M:%S",
        "%d/%m/%Y",
        "%m/%d/%Y",
    };
    CSVUtils::Dialect dialect;
    std::string trimChars = " \t";
    MalformedRowPolicy malformedRows = MalformedRowPolicy::EXCLUDE;
};
