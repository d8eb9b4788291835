#pragma once
#include "AnalysisConfig.h"
#include "CSVUtils.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

// Ordered from most to least specific; inference picks the first type every non-null cell satisfies.
enum class ColumnType { INTEGER, FLOAT, BOOLEAN, DATE, STRING };

struct DateValue {
    int64_t unixSeconds = 0;

    friend bool operator==(const DateValue& a, const DateValue& b) noexcept { return a.unixSeconds == b.unixSeconds; }
    friend bool operator!=(const DateValue& a, const DateValue& b) noexcept { return !(a == b); }
    friend bool operator<(const DateValue& a, const DateValue& b) noexcept { return a.unixSeconds < b.unixSeconds; }
};

// Min/max carrier for the ordered column types (INTEGER, FLOAT, DATE).
using OrderedValue = std::variant<int64_t, double, DateValue>;

const char* columnTypeName(ColumnType type) noexcept;

class TypeInference {
public:
    explicit TypeInference(InferenceConfig config);

    // Cell classifiers. All are total: they report failure instead of throwing.
    static bool parseInteger(std::string_view cell, int64_t& out);
    static bool parseFloat(std::string_view cell, double& out);
    bool parseBoolean(std::string_view cell, bool& out) const;
    bool parseDate(std::string_view cell, DateValue& out) const;

    /**
     * @brief Bitmask of the types in `candidates` that a trimmed, non-empty cell satisfies.
     */
    uint32_t classify(std::string_view cell, uint32_t candidates) const;

    /**
     * @brief Narrowest common type over the non-null cells of one column of well-formed rows.
     * @details Order independent: the result is the intersection of per-cell type sets.
     */
    ColumnType inferColumn(const CSVUtils::ParsedTable& table, size_t column) const;
    std::vector<ColumnType> inferTable(const CSVUtils::ParsedTable& table) const;

    /**
     * @brief Trims the configured whitespace; an empty result denotes a null cell.
     */
    std::string_view normalizeCell(std::string_view cell) const;

    static bool isValidDatePattern(std::string_view pattern);
    static std::string formatDate(const DateValue& value);

    const InferenceConfig& config() const noexcept { return config_; }

private:
    struct DateToken {
        enum class Kind { LITERAL, YEAR4, YEAR2, MONTH, MONTH_NAME, DAY, HOUR, MINUTE, SECOND };
        Kind kind = Kind::LITERAL;
        char literal = '\0';
    };
    using DatePattern = std::vector<DateToken>;

    static bool compileDatePattern(std::string_view pattern, DatePattern& out);
    static bool matchDatePattern(std::string_view cell, const DatePattern& pattern, DateValue& out);

    InferenceConfig config_;
    std::vector<DatePattern> datePatterns_;
    std::unordered_map<std::string, bool> booleanLookup_;
};

inline constexpr uint32_t typeBit(ColumnType type) noexcept {
    return 1u << static_cast<uint32_t>(type);
}

inline constexpr uint32_t kNarrowableTypesMask =
    typeBit(ColumnType::INTEGER) | typeBit(ColumnType::FLOAT) | typeBit(ColumnType::BOOLEAN) | typeBit(ColumnType::DATE);
