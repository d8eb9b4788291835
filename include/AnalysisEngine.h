#pragma once
#include "AnalysisConfig.h"
#include "CSVUtils.h"
#include "EncodingResolver.h"
#include "StatsEngine.h"
#include "ValidationOutcome.h"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

class AnalysisReport {
public:
    AnalysisReport(std::string encoding,
                   size_t byteSize,
                   std::vector<std::string> header,
                   std::vector<ColumnProfile> columns,
                   std::vector<CSVUtils::DataRow> preview,
                   size_t validRows,
                   size_t malformedRows,
                   ValidationOutcome validation);

    const std::string& encoding() const noexcept { return encoding_; }
    size_t byteSize() const noexcept { return byteSize_; }
    // Well-formed data rows; every profile satisfies nullCount + nonNullCount == rowCount().
    size_t rowCount() const noexcept { return validRows_; }
    size_t malformedRowCount() const noexcept { return malformedRows_; }
    size_t totalRowCount() const noexcept { return validRows_ + malformedRows_; }
    size_t columnCount() const noexcept { return header_.size(); }
    const std::vector<std::string>& header() const noexcept { return header_; }
    const std::vector<ColumnProfile>& columns() const noexcept { return columns_; }
    const std::vector<CSVUtils::DataRow>& preview() const noexcept { return preview_; }
    const ValidationOutcome& validation() const noexcept { return validation_; }

private:
    std::string encoding_;
    size_t byteSize_;
    std::vector<std::string> header_;
    std::vector<ColumnProfile> columns_;
    std::vector<CSVUtils::DataRow> preview_;
    size_t validRows_;
    size_t malformedRows_;
    ValidationOutcome validation_;
};

struct EngineError {
    enum class Kind { ENCODING_ERROR, REJECTED, NO_VALID_ROWS, INTERNAL_ERROR };

    Kind kind = Kind::REJECTED;
    std::string rule;
    std::string detail;
};

const char* engineErrorKindName(EngineError::Kind kind) noexcept;

using AnalysisOutcome = std::variant<AnalysisReport, EngineError>;

class AnalysisEngine {
public:
    /**
     * @brief Decodes, validates, parses, infers and profiles one file.
     * @details Pure and synchronous; limits and config are never read from global state.
     * @throws Sift::EncodingException when the bytes cannot be decoded.
     * @throws Sift::ValidationException on structural rejection, NoValidRows or MalformedRows.
     */
    static AnalysisReport analyze(const RawFile& file,
                                  const AnalysisLimits& limits,
                                  const InferenceConfig& config);

    /**
     * @brief Same as analyze() but reports engine failures as an EngineError value.
     * @details Never throws; unexpected std::exception failures (e.g. std::bad_alloc) become INTERNAL_ERROR.
     */
    static AnalysisOutcome evaluate(const RawFile& file,
                                    const AnalysisLimits& limits,
                                    const InferenceConfig& config);
};
