#include "StructuralValidator.h"
#include "CSVUtils.h"

#include <string>
#include <unordered_set>
#include <vector>

ValidationOutcome StructuralValidator::checkSize(size_t byteSize, const AnalysisLimits& limits) {
    if (byteSize > limits.maxBytes) {
        return ValidationOutcome::reject(ValidationRule::kFileTooLarge,
                                         "file size of " + std::to_string(byteSize) +
                                         " bytes exceeds the limit of " + std::to_string(limits.maxBytes) + " bytes");
    }
    return ValidationOutcome::accept();
}

ValidationOutcome StructuralValidator::validate(size_t byteSize,
                                                std::string_view text,
                                                const CSVUtils::Dialect& dialect,
                                                const AnalysisLimits& limits) {
    ValidationOutcome outcome = checkSize(byteSize, limits);
    if (!outcome.accepted()) return outcome;

    CSVUtils::RecordReader reader(text, dialect);
    std::vector<std::string> header;
    bool unterminated = false;
    if (!reader.next(header, &unterminated)) {
        return ValidationOutcome::reject(ValidationRule::kEmptyFile, "the file contains no header row");
    }
    if (unterminated) {
        return ValidationOutcome::reject(ValidationRule::kMalformedHeader,
                                         "the header row has an unterminated quoted field");
    }

    size_t rows = 0;
    while (reader.skip()) ++rows;
    if (rows > limits.maxRows) {
        return ValidationOutcome::reject(ValidationRule::kTooManyRows,
                                         std::to_string(rows) + " data rows exceed the limit of " +
                                         std::to_string(limits.maxRows));
    }

    if (header.size() > limits.maxColumns) {
        return ValidationOutcome::reject(ValidationRule::kTooManyColumns,
                                         std::to_string(header.size()) + " columns exceed the limit of " +
                                         std::to_string(limits.maxColumns));
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < header.size(); ++i) {
        if (!seen.insert(header[i]).second) {
            return ValidationOutcome::reject(ValidationRule::kDuplicateColumn,
                                             "column '" + header[i] + "' appears more than once (position " +
                                             std::to_string(i + 1) + ")");
        }
    }

    return ValidationOutcome::accept();
}
