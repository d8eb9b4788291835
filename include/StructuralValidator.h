#pragma once
#include "AnalysisConfig.h"
#include "ValidationOutcome.h"

#include <cstddef>
#include <string_view>

class StructuralValidator {
public:
    /**
     * @brief Rule 1 only; lets callers refuse oversized payloads before decoding them.
     */
    static ValidationOutcome checkSize(size_t byteSize, const AnalysisLimits& limits);

    /**
     * @brief Runs every structural rule in order and stops at the first failure.
     * @details Only the header is tokenized; data records are counted, never materialized.
     */
    static ValidationOutcome validate(size_t byteSize,
                                      std::string_view text,
                                      const CSVUtils::Dialect& dialect,
                                      const AnalysisLimits& limits);
};
