#include "SampleExtractor.h"

#include <algorithm>
#include <cstddef>

std::vector<CSVUtils::DataRow> SampleExtractor::extract(const CSVUtils::ParsedTable& table, size_t limit) {
    const size_t n = std::min(limit, table.rows.size());
    return std::vector<CSVUtils::DataRow>(table.rows.begin(), table.rows.begin() + static_cast<std::ptrdiff_t>(n));
}
