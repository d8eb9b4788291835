#pragma once
#include "AnalysisEngine.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct JsonValue {
    enum class Type { Null, Bool, Integer, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    int64_t integerValue = 0;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    // Insertion ordered so serialized reports are byte-for-byte reproducible.
    std::vector<std::pair<std::string, JsonValue>> objectValue;

    static JsonValue null() { return JsonValue{}; }
    static JsonValue boolean(bool v);
    static JsonValue integer(int64_t v);
    static JsonValue number(double v);
    static JsonValue string(std::string v);
    static JsonValue array();
    static JsonValue object();

    JsonValue& set(std::string key, JsonValue value);
    JsonValue& push(JsonValue value);

    std::string dump() const;
};

namespace JsonWriter {
JsonValue reportToJson(const AnalysisReport& report, const std::string& fileName);
JsonValue errorToJson(const EngineError& error, const std::string& fileName);
}
