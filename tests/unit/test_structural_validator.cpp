#include <gtest/gtest.h>

#include "StructuralValidator.h"

#include <string>

namespace {
ValidationOutcome run(const std::string& text, const AnalysisLimits& limits = AnalysisLimits{}) {
    return StructuralValidator::validate(text.size(), text, CSVUtils::Dialect{}, limits);
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
}

// ─── Acceptance ──────────────────────────────────────────────────────────────

TEST(StructuralValidator, AcceptsWellFormedFile)
{
    const auto outcome = run("id,name\n1,a\n2,b\n");
    EXPECT_TRUE(outcome.accepted());
    EXPECT_TRUE(outcome.rule.empty());
}

TEST(StructuralValidator, HeaderOnlyFileIsAccepted)
{
    EXPECT_TRUE(run("a,b\n").accepted());
}

TEST(StructuralValidator, ColumnNamesAreCaseSensitive)
{
    EXPECT_TRUE(run("a,A\n1,2\n").accepted());
}

TEST(StructuralValidator, DataRowWidthIsNotInspected)
{
    EXPECT_TRUE(run("a,b\n1,2,3\n").accepted());
}

TEST(StructuralValidator, LimitsAreInclusive)
{
    AnalysisLimits limits;
    limits.maxRows = 2;
    limits.maxColumns = 2;
    const std::string text = "a,b\n1,2\n3,4\n";
    limits.maxBytes = text.size();
    EXPECT_TRUE(run(text, limits).accepted());
}

// ─── Rejection Rules ─────────────────────────────────────────────────────────

TEST(StructuralValidator, FileTooLarge)
{
    AnalysisLimits limits;
    limits.maxBytes = 10;
    const auto outcome = StructuralValidator::checkSize(11, limits);
    ASSERT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.rule, ValidationRule::kFileTooLarge);
    EXPECT_TRUE(contains(outcome.detail, "11"));
    EXPECT_TRUE(contains(outcome.detail, "10"));
}

TEST(StructuralValidator, EmptyFile)
{
    EXPECT_EQ(run("").rule, ValidationRule::kEmptyFile);
    EXPECT_EQ(run("\n\r\n\n").rule, ValidationRule::kEmptyFile);
}

TEST(StructuralValidator, MalformedHeader)
{
    EXPECT_EQ(run("\"a,b\n1,2\n").rule, ValidationRule::kMalformedHeader);
}

TEST(StructuralValidator, TooManyRowsReportsCountAndLimit)
{
    AnalysisLimits limits;
    limits.maxRows = 2;
    const auto outcome = run("a\n1\n2\n3\n", limits);
    ASSERT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.rule, ValidationRule::kTooManyRows);
    EXPECT_TRUE(contains(outcome.detail, "3 data rows"));
    EXPECT_TRUE(contains(outcome.detail, "limit of 2"));
}

TEST(StructuralValidator, QuotedLineBreakCountsAsOneRow)
{
    AnalysisLimits limits;
    limits.maxRows = 1;
    EXPECT_TRUE(run("a,b\n\"x\ny\nz\",1\n", limits).accepted());
}

TEST(StructuralValidator, TooManyColumns)
{
    AnalysisLimits limits;
    limits.maxColumns = 2;
    const auto outcome = run("a,b,c\n1,2,3\n", limits);
    EXPECT_EQ(outcome.rule, ValidationRule::kTooManyColumns);
    EXPECT_TRUE(contains(outcome.detail, "3 columns"));
}

TEST(StructuralValidator, DuplicateColumnNamesTheColumn)
{
    const auto outcome = run("a,b,a\n1,2,3\n");
    ASSERT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.rule, ValidationRule::kDuplicateColumn);
    EXPECT_TRUE(contains(outcome.detail, "'a'"));
}

// ─── Rule Order ──────────────────────────────────────────────────────────────

TEST(StructuralValidator, SizeIsCheckedFirst)
{
    AnalysisLimits limits;
    limits.maxBytes = 4;
    EXPECT_EQ(run("a,b,a\n1,2,3\n", limits).rule, ValidationRule::kFileTooLarge);
}

TEST(StructuralValidator, RowsAreCheckedBeforeColumns)
{
    AnalysisLimits limits;
    limits.maxRows = 1;
    limits.maxColumns = 2;
    EXPECT_EQ(run("a,b,c\n1,2,3\n4,5,6\n", limits).rule, ValidationRule::kTooManyRows);
}

TEST(StructuralValidator, ColumnsAreCheckedBeforeDuplicates)
{
    AnalysisLimits limits;
    limits.maxColumns = 2;
    EXPECT_EQ(run("a,b,a\n", limits).rule, ValidationRule::kTooManyColumns);
}
