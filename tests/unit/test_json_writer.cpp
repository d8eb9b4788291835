#include <gtest/gtest.h>

#include "AnalysisEngine.h"
#include "JsonWriter.h"

#include <cstdlib>
#include <limits>
#include <string>

// ─── JsonValue ───────────────────────────────────────────────────────────────

TEST(JsonWriter, EscapesStrings)
{
    EXPECT_EQ(JsonValue::string("a\"b\\c\nd\te").dump(), "\"a\\\"b\\\\c\\nd\\te\"");
    EXPECT_EQ(JsonValue::string(std::string("\x01", 1)).dump(), "\"\\u0001\"");
    EXPECT_EQ(JsonValue::string("caf\xc3\xa9").dump(), "\"caf\xc3\xa9\"");
}

TEST(JsonWriter, ObjectKeepsInsertionOrder)
{
    JsonValue obj = JsonValue::object();
    obj.set("zeta", JsonValue::integer(1));
    obj.set("alpha", JsonValue::boolean(false));
    obj.set("mid", JsonValue::null());
    EXPECT_EQ(obj.dump(), "{\"zeta\":1,\"alpha\":false,\"mid\":null}");
}

TEST(JsonWriter, NonFiniteNumbersBecomeNull)
{
    EXPECT_EQ(JsonValue::number(std::numeric_limits<double>::infinity()).dump(), "null");
    EXPECT_EQ(JsonValue::number(2.5).dump(), "2.5");
}

TEST(JsonWriter, NumbersRoundTrip)
{
    EXPECT_EQ(JsonValue::number(0.1).dump(), "0.1");
    EXPECT_EQ(JsonValue::number(0.10000000000000002).dump(), "0.10000000000000002");
    EXPECT_EQ(JsonValue::number(1e-300).dump(), "1e-300");
    const std::string largest = JsonValue::number(std::numeric_limits<double>::max()).dump();
    EXPECT_EQ(std::strtod(largest.c_str(), nullptr), std::numeric_limits<double>::max());
}

TEST(JsonWriter, NestedArrays)
{
    JsonValue arr = JsonValue::array();
    arr.push(JsonValue::integer(-3));
    arr.push(JsonValue::array());
    EXPECT_EQ(arr.dump(), "[-3,[]]");
}

// ─── Reports ─────────────────────────────────────────────────────────────────

TEST(JsonWriter, ReportFieldsAndOrder)
{
    RawFile file;
    file.bytes = "id,when\n1,2024-01-02\n3,\n";
    const auto report = AnalysisEngine::analyze(file, AnalysisLimits{}, InferenceConfig{});
    const std::string json = JsonWriter::reportToJson(report, "data.csv").dump();

    EXPECT_EQ(json.rfind("{\"status\":\"success\",\"file_name\":\"data.csv\"", 0), 0u);
    EXPECT_NE(json.find("\"columns\":[\"id\",\"when\"]"), std::string::npos);
    EXPECT_NE(json.find("\"id\":{\"type\":\"integer\",\"null_count\":0,\"non_null_count\":2,"
                        "\"unique_count\":2,\"unique_ratio\":1,\"min\":1,\"max\":3,\"sample_values\":[\"1\",\"3\"]}"),
              std::string::npos);
    EXPECT_NE(json.find("\"when\":{\"type\":\"date\",\"null_count\":1"), std::string::npos);
    EXPECT_NE(json.find("\"min\":\"2024-01-02\""), std::string::npos);
    EXPECT_NE(json.find("{\"line\":2,\"malformed\":false,\"cells\":[\"1\",\"2024-01-02\"]}"), std::string::npos);

    const size_t columnTypes = json.find("\"column_types\"");
    const size_t sampleData = json.find("\"sample_data\"");
    const size_t notes = json.find("\"notes\"");
    ASSERT_NE(columnTypes, std::string::npos);
    EXPECT_LT(columnTypes, sampleData);
    EXPECT_LT(sampleData, notes);
}

TEST(JsonWriter, CloseFloatBoundsStayDistinct)
{
    RawFile file;
    file.bytes = "x\n0.1\n0.10000000000000002\n";
    const auto report = AnalysisEngine::analyze(file, AnalysisLimits{}, InferenceConfig{});
    const std::string json = JsonWriter::reportToJson(report, "x.csv").dump();
    EXPECT_NE(json.find("\"unique_count\":2,\"unique_ratio\":1,\"min\":0.1,\"max\":0.10000000000000002"),
              std::string::npos);
}

TEST(JsonWriter, UniqueRatioIsRounded)
{
    RawFile file;
    file.bytes = "g,e\na,\nb,\na,\n";
    const auto report = AnalysisEngine::analyze(file, AnalysisLimits{}, InferenceConfig{});
    const std::string json = JsonWriter::reportToJson(report, "g.csv").dump();
    EXPECT_NE(json.find("\"g\":{\"type\":\"string\",\"null_count\":0,\"non_null_count\":3,"
                        "\"unique_count\":2,\"unique_ratio\":0.67"),
              std::string::npos);
    EXPECT_NE(json.find("\"unique_count\":0,\"unique_ratio\":0,"), std::string::npos);
}

TEST(JsonWriter, ErrorShape)
{
    const EngineError error{EngineError::Kind::REJECTED, "DuplicateColumn", "column 'a' appears more than once"};
    EXPECT_EQ(JsonWriter::errorToJson(error, "x.csv").dump(),
              "{\"status\":\"error\",\"file_name\":\"x.csv\",\"error\":\"Rejected\","
              "\"rule\":\"DuplicateColumn\",\"detail\":\"column 'a' appears more than once\"}");
}
