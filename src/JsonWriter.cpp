#include "JsonWriter.h"
#include "TypeInference.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <variant>

namespace {
void appendEscaped(std::ostringstream& out, const std::string& value) {
    out << '"';
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out << buffer;
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
}

// Shortest %g rendering that parses back to the same double.
std::string formatNumber(double value) {
    char buffer[32];
    for (int precision = 15; precision < std::numeric_limits<double>::max_digits10; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) return buffer;
    }
    std::snprintf(buffer, sizeof(buffer), "%.*g", std::numeric_limits<double>::max_digits10, value);
    return buffer;
}

JsonValue orderedToJson(const OrderedValue& value) {
    if (const auto* iv = std::get_if<int64_t>(&value)) return JsonValue::integer(*iv);
    if (const auto* dv = std::get_if<double>(&value)) return JsonValue::number(*dv);
    return JsonValue::string(TypeInference::formatDate(std::get<DateValue>(value)));
}

// Distinct values per well-formed row, rounded to two decimals.
JsonValue uniqueRatio(const ColumnProfile& profile, size_t rowCount) {
    if (rowCount == 0) return JsonValue::null();
    const double ratio = static_cast<double>(profile.distinctCount) / static_cast<double>(rowCount);
    return JsonValue::number(std::round(ratio * 100.0) / 100.0);
}

JsonValue stringArray(const std::vector<std::string>& values) {
    JsonValue arr = JsonValue::array();
    for (const auto& v : values) arr.push(JsonValue::string(v));
    return arr;
}
}

JsonValue JsonValue::boolean(bool v) {
    JsonValue out;
    out.type = Type::Bool;
    out.booleanValue = v;
    return out;
}

JsonValue JsonValue::integer(int64_t v) {
    JsonValue out;
    out.type = Type::Integer;
    out.integerValue = v;
    return out;
}

JsonValue JsonValue::number(double v) {
    JsonValue out;
    out.type = Type::Number;
    out.numberValue = v;
    return out;
}

JsonValue JsonValue::string(std::string v) {
    JsonValue out;
    out.type = Type::String;
    out.stringValue = std::move(v);
    return out;
}

JsonValue JsonValue::array() {
    JsonValue out;
    out.type = Type::Array;
    return out;
}

JsonValue JsonValue::object() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

JsonValue& JsonValue::set(std::string key, JsonValue value) {
    objectValue.emplace_back(std::move(key), std::move(value));
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    arrayValue.push_back(std::move(value));
    return *this;
}

std::string JsonValue::dump() const {
    std::ostringstream out;
    switch (type) {
        case Type::Null:
            out << "null";
            break;
        case Type::Bool:
            out << (booleanValue ? "true" : "false");
            break;
        case Type::Integer:
            out << integerValue;
            break;
        case Type::Number:
            if (std::isfinite(numberValue)) {
                out << formatNumber(numberValue);
            } else {
                out << "null";
            }
            break;
        case Type::String:
            appendEscaped(out, stringValue);
            break;
        case Type::Array:
            out << '[';
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                out << arrayValue[i].dump();
            }
            out << ']';
            break;
        case Type::Object:
            out << '{';
            for (size_t i = 0; i < objectValue.size(); ++i) {
                if (i > 0) out << ',';
                appendEscaped(out, objectValue[i].first);
                out << ':' << objectValue[i].second.dump();
            }
            out << '}';
            break;
    }
    return out.str();
}

namespace JsonWriter {
JsonValue reportToJson(const AnalysisReport& report, const std::string& fileName) {
    JsonValue columnTypes = JsonValue::object();
    for (const auto& profile : report.columns()) {
        JsonValue col = JsonValue::object();
        col.set("type", JsonValue::string(columnTypeName(profile.type)));
        col.set("null_count", JsonValue::integer(static_cast<int64_t>(profile.nullCount)));
        col.set("non_null_count", JsonValue::integer(static_cast<int64_t>(profile.nonNullCount)));
        col.set("unique_count", JsonValue::integer(static_cast<int64_t>(profile.distinctCount)));
        col.set("unique_ratio", uniqueRatio(profile, report.rowCount()));
        col.set("min", profile.min ? orderedToJson(*profile.min) : JsonValue::null());
        col.set("max", profile.max ? orderedToJson(*profile.max) : JsonValue::null());
        col.set("sample_values", stringArray(profile.sampleValues));
        columnTypes.set(profile.name, std::move(col));
    }

    JsonValue sample = JsonValue::array();
    for (const auto& row : report.preview()) {
        JsonValue entry = JsonValue::object();
        entry.set("line", JsonValue::integer(static_cast<int64_t>(row.lineNumber)));
        entry.set("malformed", JsonValue::boolean(row.malformed));
        entry.set("cells", stringArray(row.cells));
        sample.push(std::move(entry));
    }

    JsonValue root = JsonValue::object();
    root.set("status", JsonValue::string("success"));
    root.set("file_name", JsonValue::string(fileName));
    root.set("file_size", JsonValue::integer(static_cast<int64_t>(report.byteSize())));
    root.set("encoding", JsonValue::string(report.encoding()));
    root.set("total_rows", JsonValue::integer(static_cast<int64_t>(report.totalRowCount())));
    root.set("valid_rows", JsonValue::integer(static_cast<int64_t>(report.rowCount())));
    root.set("malformed_rows", JsonValue::integer(static_cast<int64_t>(report.malformedRowCount())));
    root.set("total_columns", JsonValue::integer(static_cast<int64_t>(report.columnCount())));
    root.set("columns", stringArray(report.header()));
    root.set("column_types", std::move(columnTypes));
    root.set("sample_data", std::move(sample));
    root.set("notes", stringArray(report.validation().notes));
    return root;
}

JsonValue errorToJson(const EngineError& error, const std::string& fileName) {
    JsonValue root = JsonValue::object();
    root.set("status", JsonValue::string("error"));
    root.set("file_name", JsonValue::string(fileName));
    root.set("error", JsonValue::string(engineErrorKindName(error.kind)));
    root.set("rule", JsonValue::string(error.rule));
    root.set("detail", JsonValue::string(error.detail));
    return root;
}
}
