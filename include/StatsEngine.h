#pragma once
#include "CSVUtils.h"
#include "TypeInference.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct ColumnProfile {
    std::string name;
    ColumnType type = ColumnType::STRING;
    size_t nullCount = 0;
    size_t nonNullCount = 0;
    size_t distinctCount = 0;
    // Present only for INTEGER, FLOAT and DATE columns with at least one value.
    std::optional<OrderedValue> min;
    std::optional<OrderedValue> max;
    // First non-null trimmed values in row order.
    std::vector<std::string> sampleValues;
};

class StatsEngine {
public:
    /**
     * @brief Profiles one column of the well-formed rows under an already inferred type.
     * @details Distinct values compare as text for STRING/BOOLEAN and as parsed values for ordered types.
     */
    static ColumnProfile profileColumn(const CSVUtils::ParsedTable& table,
                                       size_t column,
                                       ColumnType type,
                                       const TypeInference& inference,
                                       size_t sampleLimit);

    static std::vector<ColumnProfile> profileTable(const CSVUtils::ParsedTable& table,
                                                   const std::vector<ColumnType>& types,
                                                   const TypeInference& inference,
                                                   size_t sampleLimit);
};
