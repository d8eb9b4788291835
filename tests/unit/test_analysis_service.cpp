#include <gtest/gtest.h>

#include "AnalysisService.h"

#include <map>
#include <string>

namespace {
bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
}

// ─── /analyze ────────────────────────────────────────────────────────────────

TEST(AnalysisService, AcceptedFileReturns200)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    const auto response = service.handleAnalyze("id,name\n1,a\n2,b\n", {{"filename", "people.csv"}});
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(contains(response.body, "\"status\":\"success\""));
    EXPECT_TRUE(contains(response.body, "\"file_name\":\"people.csv\""));
}

TEST(AnalysisService, WrongExtensionReturns400)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    const auto response = service.handleAnalyze("id\n1\n", {{"filename", "people.xlsx"}});
    EXPECT_EQ(response.status, 400);
    EXPECT_TRUE(contains(response.body, "\"rule\":\"InvalidFileType\""));
}

TEST(AnalysisService, StructuralRejectionReturns400)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    const auto response = service.handleAnalyze("a,b,a\n1,2,3\n", {});
    EXPECT_EQ(response.status, 400);
    EXPECT_TRUE(contains(response.body, "\"rule\":\"DuplicateColumn\""));
}

TEST(AnalysisService, NoValidRowsReturns422)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    const auto response = service.handleAnalyze("a,b\n1\n2\n", {{"filename", "x.csv"}});
    EXPECT_EQ(response.status, 422);
    EXPECT_TRUE(contains(response.body, "\"error\":\"NoValidRows\""));
}

TEST(AnalysisService, RequestParametersOverrideDefaults)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    const auto response = service.handleAnalyze("a;b\n1;2\n3;4\n5;6\n",
                                                {{"delimiter", ";"}, {"preview", "1"}});
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(contains(response.body, "\"columns\":[\"a\",\"b\"]"));
    EXPECT_TRUE(contains(response.body, "\"sample_values\":[\"1\"]"));
}

TEST(AnalysisService, InvalidParameterReturns400)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    const auto response = service.handleAnalyze("a\n1\n", {{"delimiter", "ab"}});
    EXPECT_EQ(response.status, 400);
    EXPECT_TRUE(contains(response.body, "\"rule\":\"InvalidParameter\""));
}

// ─── /stats ──────────────────────────────────────────────────────────────────

TEST(AnalysisService, StatsCountOutcomes)
{
    RequestMonitor monitor;
    AnalysisService service(SiftConfig{}, monitor);
    service.handleAnalyze("a\n1\n", {});
    service.handleAnalyze("a,a\n1,2\n", {});
    service.handleAnalyze("a\n1\n", {{"encoding", "nope"}});

    const auto snapshot = monitor.snapshot();
    EXPECT_EQ(snapshot.totalRequests, 3u);
    EXPECT_EQ(snapshot.acceptedFiles, 1u);
    EXPECT_EQ(snapshot.rejectedFiles, 1u);
    EXPECT_EQ(snapshot.errorRequests, 1u);

    const auto stats = service.handleStats();
    EXPECT_EQ(stats.status, 200);
    EXPECT_TRUE(contains(stats.body, "\"total_requests\":3"));
    EXPECT_TRUE(contains(stats.body, "\"accepted_files\":1"));
}
