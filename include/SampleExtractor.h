#pragma once
#include "CSVUtils.h"

#include <cstddef>
#include <vector>

class SampleExtractor {
public:
    // First `limit` parsed rows verbatim, malformed rows included.
    static std::vector<CSVUtils::DataRow> extract(const CSVUtils::ParsedTable& table, size_t limit);
};
