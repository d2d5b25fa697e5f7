/**
 * @file test_scan_walk_pipeline.cpp
 * @brief Integration tests: archive tree -> scanner -> aggregator -> report
 */

#include <gtest/gtest.h>

#include <sstream>

#include "Aggregator.hpp"
#include "ArchiveScanner.hpp"
#include "ReportWriter.hpp"
#include "test_helpers.hpp"

using namespace UPIFINDER;
using UPIFINDER::test::MakeName;
using UPIFINDER::test::TarBuilder;
using UPIFINDER::test::TempDir;
using UPIFINDER::test::TimeOfDay;

class ScanWalkPipelineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // 38/XYZ: 1, 2 (twice), 4 in a tar, 5 corrupted
        dir_.WriteFile("a/" + Name("38", "XYZ", 1), 1 << 20);
        dir_.WriteFile("a/" + Name("38", "XYZ", 2), 1 << 20);
        dir_.WriteFile("b/" + Name("38", "XYZ", 2), 1 << 20);
        TarBuilder()
            .Add(Name("38", "XYZ", 4), 1 << 20)
            .WriteTo(dir_, "b/nested/members.tar");
        dir_.WriteFile("b/" + Name("38", "XYZ", 5, ".bad"), 1 << 20);

        // 37/ABC: 7, 8 from a list file (no size)
        dir_.WriteText("b/remote.lst",
                       Name("37", "ABC", 7) + "\n" + Name("37", "ABC", 8) + "\n");
    }

    static std::string Name(const std::string &source, const std::string &upi, uint32_t seq,
                            const std::string &ext = ".dat")
    {
        return MakeName(source, upi, 2, seq, "20180601", TimeOfDay(seq), ext);
    }

    Audit::Aggregator Run(PartitionFunc partition = ByUPI)
    {
        Archive::ArchiveScanner scanner;
        Audit::Aggregator aggregator(partition);
        auto queue = scanner.Start({(dir_.Path() / "a").string(), (dir_.Path() / "b").string(),
                                    (dir_.Path() / "missing").string()});
        aggregator.Consume(*queue);
        status_ = scanner.Wait();
        return aggregator;
    }

    TempDir dir_;
    Status status_ = Ok();
};

// Test: Counters per UPI across roots and containers
TEST_F(ScanWalkPipelineTest, AggregatesPerUPI)
{
    auto aggregator = Run();
    ASSERT_TRUE(isOk(status_));

    const auto &results = aggregator.GetResults();
    ASSERT_EQ(results.size(), 2u);

    const Audit::Coze &xyz = results.at("38/XYZ");
    EXPECT_EQ(xyz.count, 5u);
    EXPECT_EQ(xyz.uniq, 3u);
    EXPECT_EQ(xyz.invalid, 1u);
    EXPECT_EQ(xyz.size, 5u << 20);
    EXPECT_EQ(xyz.first, 1u);
    EXPECT_EQ(xyz.last, 5u);
    EXPECT_EQ(xyz.Missing(), 1u);

    const Audit::Coze &abc = results.at("37/ABC");
    EXPECT_EQ(abc.count, 2u);
    EXPECT_EQ(abc.uniq, 2u);
    EXPECT_EQ(abc.size, 0u);
    EXPECT_EQ(abc.Missing(), 0u);
}

// Test: Grouping by source
TEST_F(ScanWalkPipelineTest, GroupBySource)
{
    auto aggregator = Run(BySource);
    ASSERT_TRUE(isOk(status_));

    const auto &results = aggregator.GetResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results.at("38").count, 5u);
    EXPECT_EQ(results.at("37").count, 2u);
}

// Test: Summary of the run
TEST_F(ScanWalkPipelineTest, SummaryReport)
{
    auto aggregator = Run();
    ASSERT_TRUE(isOk(status_));

    std::ostringstream out;
    std::ostringstream summary;
    ASSERT_TRUE(isOk(Report::WriteWalkReport(out, summary, aggregator, OutputFormat::Summary,
                                             Report::RunInfo{})));
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(summary.str(), "7 files found (5MB) - uniq: 5 - corrupted: 1 (14.29%)\n");
}

// Test: The inspect report shows the hole of 38/XYZ
TEST_F(ScanWalkPipelineTest, InspectReport)
{
    auto aggregator = Run();
    ASSERT_TRUE(isOk(status_));

    std::ostringstream out;
    Report::WriteInspectReport(out, aggregator.GetResults());
    const std::string text = out.str();
    EXPECT_NE(text.find("38/XYZ (2018-06-01 00:00:01 - 2018-06-01 00:00:05)"), std::string::npos);
    EXPECT_NE(text.find("-- 1: 2 -> 4 (missing: 1)"), std::string::npos);
    EXPECT_NE(text.find("37/ABC"), std::string::npos);
}
