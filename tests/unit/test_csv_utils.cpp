#include <gtest/gtest.h>

#include "CSVUtils.h"

#include <string>
#include <vector>

using CSVUtils::Dialect;
using CSVUtils::parseTable;
using CSVUtils::RecordReader;

// ─── Basic Splitting ─────────────────────────────────────────────────────────

TEST(CSVUtils, SplitsHeaderAndRows)
{
    const auto table = parseTable("a,b\n1,2\n3,4\n", Dialect{});
    ASSERT_EQ(table.header, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0].cells, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(table.rows[1].cells, (std::vector<std::string>{"3", "4"}));
    EXPECT_EQ(table.rows[0].lineNumber, 2u);
    EXPECT_EQ(table.rows[1].lineNumber, 3u);
    EXPECT_EQ(table.malformedCount, 0u);
    EXPECT_EQ(table.validRowCount(), 2u);
}

TEST(CSVUtils, HandlesCrLfAndMissingTrailingNewline)
{
    const auto table = parseTable("a,b\r\n1,2\r\n3,4", Dialect{});
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0].cells, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(table.rows[1].cells, (std::vector<std::string>{"3", "4"}));
}

TEST(CSVUtils, SkipsBlankLines)
{
    const auto table = parseTable("a,b\n\n1,2\n\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].lineNumber, 3u);
}

TEST(CSVUtils, KeepsCellsVerbatim)
{
    const auto table = parseTable("a,b\n 1 , x \n", Dialect{});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].cells, (std::vector<std::string>{" 1 ", " x "}));
}

TEST(CSVUtils, TrailingDelimiterYieldsEmptyCell)
{
    const auto table = parseTable("a,b\n1,\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].cells, (std::vector<std::string>{"1", ""}));
    EXPECT_FALSE(table.rows[0].malformed);
}

// ─── Quoting ─────────────────────────────────────────────────────────────────

TEST(CSVUtils, QuotedFieldKeepsDelimiterAndDoubledQuote)
{
    const auto table = parseTable("name,note\n\"Smith, J\",\"said \"\"hi\"\"\"\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].cells[0], "Smith, J");
    EXPECT_EQ(table.rows[0].cells[1], "said \"hi\"");
}

TEST(CSVUtils, LineBreakInsideQuotesIsContent)
{
    const auto table = parseTable("a,b\n\"x\ny\",2\n3,4\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0].cells[0], "x\ny");
    EXPECT_EQ(table.rows[0].lineNumber, 2u);
    EXPECT_EQ(table.rows[1].lineNumber, 4u);
}

TEST(CSVUtils, QuoteInsideUnquotedFieldIsLiteral)
{
    const auto table = parseTable("a\nab\"c\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].cells[0], "ab\"c");
}

TEST(CSVUtils, CustomDialect)
{
    Dialect dialect;
    dialect.delimiter = ';';
    dialect.quote = '\'';
    const auto table = parseTable("a;b\n'x;y';2\n", dialect);
    ASSERT_EQ(table.header, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].cells, (std::vector<std::string>{"x;y", "2"}));
}

// ─── Malformed Rows ──────────────────────────────────────────────────────────

TEST(CSVUtils, WrongWidthRowIsFlaggedNotDropped)
{
    const auto table = parseTable("a,b\n1,2,3\n4,5\n6\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_TRUE(table.rows[0].malformed);
    EXPECT_FALSE(table.rows[1].malformed);
    EXPECT_TRUE(table.rows[2].malformed);
    EXPECT_EQ(table.rows[0].cells.size(), 3u);
    EXPECT_EQ(table.rows[2].cells.size(), 1u);
    EXPECT_EQ(table.malformedCount, 2u);
    EXPECT_EQ(table.validRowCount(), 1u);
}

TEST(CSVUtils, UnterminatedQuoteIsMalformed)
{
    const auto table = parseTable("a,b\n1,\"open\n", Dialect{});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_TRUE(table.rows[0].malformed);
    EXPECT_EQ(table.rows[0].cells.size(), 2u);
}

// ─── RecordReader ────────────────────────────────────────────────────────────

TEST(CSVUtils, SkipCountsRecordsNotLines)
{
    RecordReader reader("h\n1\n\"multi\nline\"\n3", Dialect{});
    std::vector<std::string> header;
    ASSERT_TRUE(reader.next(header));
    size_t count = 0;
    while (reader.skip()) ++count;
    EXPECT_EQ(count, 3u);
}

TEST(CSVUtils, EmptyInputHasNoRecords)
{
    RecordReader reader("\n\r\n", Dialect{});
    std::vector<std::string> cells;
    EXPECT_FALSE(reader.next(cells));
}
