#include "AnalysisEngine.h"
#include "SampleExtractor.h"
#include "SiftExceptions.h"
#include "StructuralValidator.h"
#include "TypeInference.h"

#include <exception>
#include <utility>

namespace {
constexpr size_t kMaxReportedMalformedLines = 10;

std::string describeMalformedRows(const CSVUtils::ParsedTable& table) {
    std::string lines;
    size_t listed = 0;
    for (const auto& row : table.rows) {
        if (!row.malformed) continue;
        if (listed == kMaxReportedMalformedLines) {
            lines += ", ...";
            break;
        }
        if (listed > 0) lines += ", ";
        lines += std::to_string(row.lineNumber);
        ++listed;
    }
    return std::to_string(table.malformedCount) + " of " + std::to_string(table.rows.size()) +
           " data rows do not match the header width of " + std::to_string(table.header.size()) +
           " (lines " + lines + ")";
}
}

AnalysisReport::AnalysisReport(std::string encoding,
                               size_t byteSize,
                               std::vector<std::string> header,
                               std::vector<ColumnProfile> columns,
                               std::vector<CSVUtils::DataRow> preview,
                               size_t validRows,
                               size_t malformedRows,
                               ValidationOutcome validation)
    : encoding_(std::move(encoding)),
      byteSize_(byteSize),
      header_(std::move(header)),
      columns_(std::move(columns)),
      preview_(std::move(preview)),
      validRows_(validRows),
      malformedRows_(malformedRows),
      validation_(std::move(validation)) {}

const char* engineErrorKindName(EngineError::Kind kind) noexcept {
    switch (kind) {
        case EngineError::Kind::ENCODING_ERROR: return "EncodingError";
        case EngineError::Kind::REJECTED: return "Rejected";
        case EngineError::Kind::NO_VALID_ROWS: return "NoValidRows";
        case EngineError::Kind::INTERNAL_ERROR: return "InternalError";
    }
    return "Rejected";
}

AnalysisReport AnalysisEngine::analyze(const RawFile& file,
                                       const AnalysisLimits& limits,
                                       const InferenceConfig& config) {
    ValidationOutcome outcome = StructuralValidator::checkSize(file.bytes.size(), limits);
    if (!outcome.accepted()) throw Sift::ValidationException(std::move(outcome));

    DecodedText decoded = EncodingResolver::decode(file.bytes, file.encodingHint);

    outcome = StructuralValidator::validate(file.bytes.size(), decoded.text, config.dialect, limits);
    if (!outcome.accepted()) throw Sift::ValidationException(std::move(outcome));

    CSVUtils::ParsedTable table = CSVUtils::parseTable(decoded.text, config.dialect);
    if (table.malformedCount > 0) {
        const std::string summary = describeMalformedRows(table);
        if (table.validRowCount() == 0) {
            throw Sift::ValidationException(ValidationOutcome::reject(ValidationRule::kNoValidRows, summary));
        }
        if (config.malformedRows == MalformedRowPolicy::REJECT) {
            throw Sift::ValidationException(ValidationOutcome::reject(ValidationRule::kMalformedRows, summary));
        }
        outcome.notes.push_back(summary + "; excluded from inference and statistics");
    }

    const TypeInference inference(config);
    const std::vector<ColumnType> types = inference.inferTable(table);
    std::vector<CSVUtils::DataRow> preview = SampleExtractor::extract(table, limits.previewSize);
    std::vector<ColumnProfile> profiles = StatsEngine::profileTable(table, types, inference, limits.previewSize);

    return AnalysisReport(std::move(decoded.encoding),
                          file.bytes.size(),
                          std::move(table.header),
                          std::move(profiles),
                          std::move(preview),
                          table.validRowCount(),
                          table.malformedCount,
                          std::move(outcome));
}

AnalysisOutcome AnalysisEngine::evaluate(const RawFile& file,
                                         const AnalysisLimits& limits,
                                         const InferenceConfig& config) {
    try {
        return analyze(file, limits, config);
    } catch (const Sift::EncodingException& ex) {
        return EngineError{EngineError::Kind::ENCODING_ERROR, "EncodingError", ex.detail()};
    } catch (const Sift::ValidationException& ex) {
        const EngineError::Kind kind = ex.rule() == ValidationRule::kNoValidRows
            ? EngineError::Kind::NO_VALID_ROWS
            : EngineError::Kind::REJECTED;
        return EngineError{kind, ex.rule(), ex.detail()};
    } catch (const std::exception& ex) {
        return EngineError{EngineError::Kind::INTERNAL_ERROR, "InternalError", ex.what()};
    }
}
