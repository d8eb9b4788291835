#include "TypeInference.h"
#include "CommonUtils.h"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

namespace {
constexpr std::array<ColumnType, 4> kNarrowingOrder = {
    ColumnType::INTEGER, ColumnType::FLOAT, ColumnType::BOOLEAN, ColumnType::DATE
};

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

// Reads exactly `len` digits.
bool readFixedDigits(std::string_view s, size_t& pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        const char ch = s[pos + i];
        if (!isDigit(ch)) return false;
        value = value * 10 + (ch - '0');
    }
    pos += len;
    out = value;
    return true;
}

// Reads one or two digits, greedily.
bool readShortNumber(std::string_view s, size_t& pos, int& out) {
    if (pos >= s.size() || !isDigit(s[pos])) return false;
    const size_t len = (pos + 1 < s.size() && isDigit(s[pos + 1])) ? 2 : 1;
    return readFixedDigits(s, pos, len, out);
}

bool readMonthName(std::string_view s, size_t& pos, int& month) {
    static const char* kMonths[12] = {"jan", "feb", "mar", "apr", "may", "jun",
                                      "jul", "aug", "sep", "oct", "nov", "dec"};
    if (pos + 3 > s.size()) return false;
    const std::string_view candidate = s.substr(pos, 3);
    for (int i = 0; i < 12; ++i) {
        if (CommonUtils::iequals(candidate, kMonths[i])) {
            month = i + 1;
            pos += 3;
            return true;
        }
    }
    return false;
}
}

const char* columnTypeName(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::INTEGER: return "integer";
        case ColumnType::FLOAT: return "float";
        case ColumnType::BOOLEAN: return "boolean";
        case ColumnType::DATE: return "date";
        case ColumnType::STRING: return "string";
    }
    return "string";
}

TypeInference::TypeInference(InferenceConfig config) : config_(std::move(config)) {
    for (const auto& pattern : config_.datePatterns) {
        DatePattern compiled;
        // Patterns with unknown directives are skipped; SiftConfig::validate rejects them up front.
        if (compileDatePattern(pattern, compiled)) {
            datePatterns_.push_back(std::move(compiled));
        }
    }
    for (const auto& pair : config_.booleanTokens) {
        booleanLookup_.emplace(CommonUtils::toLower(pair.first), true);
        booleanLookup_.emplace(CommonUtils::toLower(pair.second), false);
    }
}

bool TypeInference::parseInteger(std::string_view cell, int64_t& out) {
    if (cell.empty()) return false;
    size_t start = 0;
    if (cell[0] == '+' || cell[0] == '-') start = 1;
    if (start == cell.size()) return false;
    for (size_t i = start; i < cell.size(); ++i) {
        if (!isDigit(cell[i])) return false;
    }

    // from_chars takes '-' but not '+'.
    const char* begin = cell.data() + (cell[0] == '+' ? 1 : 0);
    const char* end = cell.data() + cell.size();
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value, 10);
    if (ec != std::errc{} || ptr != end) return false;
    out = value;
    return true;
}

bool TypeInference::parseFloat(std::string_view cell, double& out) {
    // [+-]? (d+ (. d*)? | . d+) ([eE] [+-]? d+)?
    size_t pos = 0;
    if (pos < cell.size() && (cell[pos] == '+' || cell[pos] == '-')) ++pos;
    size_t intDigits = 0;
    while (pos < cell.size() && isDigit(cell[pos])) {
        ++pos;
        ++intDigits;
    }
    size_t fracDigits = 0;
    if (pos < cell.size() && cell[pos] == '.') {
        ++pos;
        while (pos < cell.size() && isDigit(cell[pos])) {
            ++pos;
            ++fracDigits;
        }
    }
    if (intDigits == 0 && fracDigits == 0) return false;
    if (pos < cell.size() && (cell[pos] == 'e' || cell[pos] == 'E')) {
        ++pos;
        if (pos < cell.size() && (cell[pos] == '+' || cell[pos] == '-')) ++pos;
        size_t expDigits = 0;
        while (pos < cell.size() && isDigit(cell[pos])) {
            ++pos;
            ++expDigits;
        }
        if (expDigits == 0) return false;
    }
    if (pos != cell.size()) return false;

    const char* begin = cell.data() + (cell[0] == '+' ? 1 : 0);
    const char* end = cell.data() + cell.size();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(begin, end, value, std::chars_format::general);
    if (ec == std::errc::result_out_of_range) {
        // Underflow rounds toward zero; overflow saturates at the largest finite double.
        const std::string literal(begin, end);
        value = std::strtod(literal.c_str(), nullptr);
        if (std::isinf(value)) value = std::copysign(std::numeric_limits<double>::max(), value);
        out = value;
        return true;
    }
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool TypeInference::parseBoolean(std::string_view cell, bool& out) const {
    const auto it = booleanLookup_.find(CommonUtils::toLower(cell));
    if (it == booleanLookup_.end()) return false;
    out = it->second;
    return true;
}

bool TypeInference::parseDate(std::string_view cell, DateValue& out) const {
    for (const auto& pattern : datePatterns_) {
        if (matchDatePattern(cell, pattern, out)) return true;
    }
    return false;
}

bool TypeInference::compileDatePattern(std::string_view pattern, DatePattern& out) {
    out.clear();
    if (pattern.empty()) return false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        DateToken token;
        if (pattern[i] != '%') {
            token.literal = pattern[i];
            out.push_back(token);
            continue;
        }
        if (++i >= pattern.size()) return false;
        switch (pattern[i]) {
            case 'Y': token.kind = DateToken::Kind::YEAR4; break;
            case 'y': token.kind = DateToken::Kind::YEAR2; break;
            case 'm': token.kind = DateToken::Kind::MONTH; break;
            case 'b': token.kind = DateToken::Kind::MONTH_NAME; break;
            case 'd': token.kind = DateToken::Kind::DAY; break;
            case 'H': token.kind = DateToken::Kind::HOUR; break;
            case 'M': token.kind = DateToken::Kind::MINUTE; break;
            case 'S': token.kind = DateToken::Kind::SECOND; break;
            case '%': token.literal = '%'; break;
            default: return false;
        }
        out.push_back(token);
    }
    return true;
}

bool TypeInference::isValidDatePattern(std::string_view pattern) {
    DatePattern scratch;
    if (!compileDatePattern(pattern, scratch)) return false;
    bool hasYear = false;
    bool hasMonth = false;
    bool hasDay = false;
    for (const auto& token : scratch) {
        hasYear = hasYear || token.kind == DateToken::Kind::YEAR4 || token.kind == DateToken::Kind::YEAR2;
        hasMonth = hasMonth || token.kind == DateToken::Kind::MONTH || token.kind == DateToken::Kind::MONTH_NAME;
        hasDay = hasDay || token.kind == DateToken::Kind::DAY;
    }
    return hasYear && hasMonth && hasDay;
}

bool TypeInference::matchDatePattern(std::string_view cell, const DatePattern& pattern, DateValue& out) {
    int year = -1;
    int month = -1;
    int day = -1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    size_t pos = 0;

    for (const auto& token : pattern) {
        bool ok = false;
        switch (token.kind) {
            case DateToken::Kind::LITERAL:
                ok = pos < cell.size() && cell[pos] == token.literal;
                if (ok) ++pos;
                break;
            case DateToken::Kind::YEAR4:
                ok = readFixedDigits(cell, pos, 4, year);
                break;
            case DateToken::Kind::YEAR2: {
                int yy = 0;
                ok = readFixedDigits(cell, pos, 2, yy);
                if (ok) year = (yy >= 70) ? (1900 + yy) : (2000 + yy);
                break;
            }
            case DateToken::Kind::MONTH: ok = readShortNumber(cell, pos, month); break;
            case DateToken::Kind::MONTH_NAME: ok = readMonthName(cell, pos, month); break;
            case DateToken::Kind::DAY: ok = readShortNumber(cell, pos, day); break;
            case DateToken::Kind::HOUR: ok = readShortNumber(cell, pos, hour); break;
            case DateToken::Kind::MINUTE: ok = readShortNumber(cell, pos, minute); break;
            case DateToken::Kind::SECOND: ok = readShortNumber(cell, pos, second); break;
        }
        if (!ok) return false;
    }
    if (pos != cell.size()) return false;

    if (year < 0 || month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    out.unixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

std::string TypeInference::formatDate(const DateValue& value) {
    int64_t days = value.unixSeconds / 86400;
    int64_t secondsOfDay = value.unixSeconds % 86400;
    if (secondsOfDay < 0) {
        secondsOfDay += 86400;
        --days;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);

    char buffer[32];
    if (secondsOfDay == 0) {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    } else {
        const int h = static_cast<int>(secondsOfDay / 3600);
        const int m = static_cast<int>((secondsOfDay % 3600) / 60);
        const int s = static_cast<int>(secondsOfDay % 60);
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d", year, month, day, h, m, s);
    }
    return buffer;
}

std::string_view TypeInference::normalizeCell(std::string_view cell) const {
    return CommonUtils::trimView(cell, config_.trimChars);
}

uint32_t TypeInference::classify(std::string_view cell, uint32_t candidates) const {
    uint32_t satisfied = 0;
    if (candidates & typeBit(ColumnType::INTEGER)) {
        int64_t iv = 0;
        if (parseInteger(cell, iv)) satisfied |= typeBit(ColumnType::INTEGER);
    }
    if (candidates & typeBit(ColumnType::FLOAT)) {
        double dv = 0.0;
        if (parseFloat(cell, dv)) satisfied |= typeBit(ColumnType::FLOAT);
    }
    if (candidates & typeBit(ColumnType::BOOLEAN)) {
        bool bv = false;
        if (parseBoolean(cell, bv)) satisfied |= typeBit(ColumnType::BOOLEAN);
    }
    if (candidates & typeBit(ColumnType::DATE)) {
        DateValue tv;
        if (parseDate(cell, tv)) satisfied |= typeBit(ColumnType::DATE);
    }
    return satisfied | (candidates & typeBit(ColumnType::STRING));
}

ColumnType TypeInference::inferColumn(const CSVUtils::ParsedTable& table, size_t column) const {
    uint32_t remaining = kNarrowableTypesMask;
    bool sawValue = false;

    for (const auto& row : table.rows) {
        if (row.malformed || column >= row.cells.size()) continue;
        const std::string_view cell = normalizeCell(row.cells[column]);
        if (cell.empty()) continue;
        sawValue = true;
        remaining &= classify(cell, remaining);
        if (remaining == 0) break;
    }

    if (!sawValue) return ColumnType::STRING;
    for (ColumnType candidate : kNarrowingOrder) {
        if (remaining & typeBit(candidate)) return candidate;
    }
    return ColumnType::STRING;
}

std::vector<ColumnType> TypeInference::inferTable(const CSVUtils::ParsedTable& table) const {
    std::vector<ColumnType> types;
    types.reserve(table.header.size());
    for (size_t c = 0; c < table.header.size(); ++c) {
        types.push_back(inferColumn(table, c));
    }
    return types;
}
