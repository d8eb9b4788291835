#include "StatsEngine.h"

#include <string_view>
#include <unordered_set>

namespace {
// Cells that fail to parse under the requested type fall back to text identity.
template <typename T, typename Parser, typename Wrap>
void collectOrdered(const std::vector<std::string_view>& values,
                    Parser parse,
                    Wrap wrap,
                    ColumnProfile& profile) {
    std::unordered_set<T> distinct;
    std::unordered_set<std::string_view> unparsed;
    bool haveRange = false;
    T lo{};
    T hi{};

    for (std::string_view v : values) {
        T parsed{};
        if (!parse(v, parsed)) {
            unparsed.insert(v);
            continue;
        }
        distinct.insert(parsed);
        if (!haveRange) {
            lo = hi = parsed;
            haveRange = true;
        } else {
            if (parsed < lo) lo = parsed;
            if (hi < parsed) hi = parsed;
        }
    }

    profile.distinctCount = distinct.size() + unparsed.size();
    if (haveRange) {
        profile.min = wrap(lo);
        profile.max = wrap(hi);
    }
}
}

ColumnProfile StatsEngine::profileColumn(const CSVUtils::ParsedTable& table,
                                         size_t column,
                                         ColumnType type,
                                         const TypeInference& inference,
                                         size_t sampleLimit) {
    ColumnProfile profile;
    profile.name = column < table.header.size() ? table.header[column] : std::string();
    profile.type = type;

    std::vector<std::string_view> values;
    values.reserve(table.validRowCount());
    for (const auto& row : table.rows) {
        if (row.malformed) continue;
        const std::string_view cell = column < row.cells.size() ? inference.normalizeCell(row.cells[column]) : std::string_view();
        if (cell.empty()) {
            ++profile.nullCount;
            continue;
        }
        values.push_back(cell);
        if (profile.sampleValues.size() < sampleLimit) {
            profile.sampleValues.emplace_back(cell);
        }
    }
    profile.nonNullCount = values.size();

    switch (type) {
        case ColumnType::INTEGER:
            collectOrdered<int64_t>(
                values,
                [](std::string_view v, int64_t& out) { return TypeInference::parseInteger(v, out); },
                [](int64_t v) { return OrderedValue(v); },
                profile);
            break;
        case ColumnType::FLOAT:
            collectOrdered<double>(
                values,
                [](std::string_view v, double& out) {
                    if (!TypeInference::parseFloat(v, out)) return false;
                    if (out == 0.0) out = 0.0;   // fold -0.0
                    return true;
                },
                [](double v) { return OrderedValue(v); },
                profile);
            break;
        case ColumnType::DATE:
            collectOrdered<int64_t>(
                values,
                [&inference](std::string_view v, int64_t& out) {
                    DateValue date;
                    if (!inference.parseDate(v, date)) return false;
                    out = date.unixSeconds;
                    return true;
                },
                [](int64_t v) { return OrderedValue(DateValue{v}); },
                profile);
            break;
        case ColumnType::BOOLEAN:
        case ColumnType::STRING: {
            std::unordered_set<std::string_view> distinct(values.begin(), values.end());
            profile.distinctCount = distinct.size();
            break;
        }
    }

    return profile;
}

std::vector<ColumnProfile> StatsEngine::profileTable(const CSVUtils::ParsedTable& table,
                                                     const std::vector<ColumnType>& types,
                                                     const TypeInference& inference,
                                                     size_t sampleLimit) {
    std::vector<ColumnProfile> profiles;
    profiles.reserve(table.header.size());
    for (size_t c = 0; c < table.header.size(); ++c) {
        const ColumnType type = c < types.size() ? types[c] : ColumnType::STRING;
        profiles.push_back(profileColumn(table, c, type, inference, sampleLimit));
    }
    return profiles;
}
