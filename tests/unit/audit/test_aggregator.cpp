/**
 * @file test_aggregator.cpp
 * @brief Unit tests for Coze and Aggregator
 */

#include <gtest/gtest.h>

#include "Aggregator.hpp"
#include "test_helpers.hpp"

using namespace UPIFINDER;
using namespace UPIFINDER::Audit;
using UPIFINDER::test::At;
using UPIFINDER::test::MakeRecord;

// Test: Counters of a single partition
TEST(AggregatorTest, CountsOnePartition)
{
    Aggregator aggregator;
    aggregator.Update(MakeRecord("38", "XYZ", 10, At(2018, 6, 1, 0, 0, 0), true, 100));
    aggregator.Update(MakeRecord("38", "XYZ", 11, At(2018, 6, 1, 0, 0, 1), true, 200));
    aggregator.Update(MakeRecord("38", "XYZ", 13, At(2018, 6, 1, 0, 0, 2), true, 300));

    const auto &results = aggregator.GetResults();
    ASSERT_EQ(results.size(), 1u);
    const Coze &c = results.at("38/XYZ");
    EXPECT_EQ(c.upi, "38/XYZ");
    EXPECT_EQ(c.count, 3u);
    EXPECT_EQ(c.uniq, 3u);
    EXPECT_EQ(c.size, 600u);
    EXPECT_EQ(c.invalid, 0u);
    EXPECT_EQ(c.first, 10u);
    EXPECT_EQ(c.last, 13u);
    EXPECT_EQ(c.starts, At(2018, 6, 1, 0, 0, 0));
    EXPECT_EQ(c.ends, At(2018, 6, 1, 0, 0, 2));
    EXPECT_EQ(c.Missing(), 1u);
}

// Test: Duplicates count but are not unique
TEST(AggregatorTest, DuplicateSequenceNotUnique)
{
    Aggregator aggregator;
    aggregator.Update(MakeRecord("38", "XYZ", 5, At(2018, 6, 1)));
    aggregator.Update(MakeRecord("38", "XYZ", 5, At(2018, 6, 1, 1)));

    const Coze &c = aggregator.GetResults().at("38/XYZ");
    EXPECT_EQ(c.count, 2u);
    EXPECT_EQ(c.uniq, 1u);
}

// Test: Invalid records are counted apart and do not touch the ranges
TEST(AggregatorTest, InvalidRecords)
{
    Aggregator aggregator;
    aggregator.Update(MakeRecord("38", "XYZ", 1, At(2018, 6, 1)));
    aggregator.Update(MakeRecord("38", "XYZ", 2, At(2018, 6, 1, 1), false));
    aggregator.Update(MakeRecord("38", "XYZ", 3, At(2018, 6, 1, 2)));
    aggregator.Update(MakeRecord("38", "XYZ", 4, At(2018, 6, 1, 3), false));

    const Coze &c = aggregator.GetResults().at("38/XYZ");
    EXPECT_EQ(c.count, 4u);
    EXPECT_EQ(c.uniq, 2u);
    EXPECT_EQ(c.invalid, 2u);
    EXPECT_DOUBLE_EQ(c.Corrupted(), 0.5);
    EXPECT_FALSE(c.ranges.Has(2));
    EXPECT_EQ(c.Missing(), 1u);
    // Time bounds follow every record
    EXPECT_EQ(c.last, 4u);
}

// Test: Corrupted ratio is zero without invalid records
TEST(AggregatorTest, CorruptedZero)
{
    Coze empty;
    EXPECT_DOUBLE_EQ(empty.Corrupted(), 0.0);

    Coze clean;
    clean.Update(MakeRecord("38", "XYZ", 1, At(2018, 6, 1)));
    EXPECT_DOUBLE_EQ(clean.Corrupted(), 0.0);
}

// Test: first/last follow acquisition time, not arrival order
TEST(AggregatorTest, BoundsFollowAcquisitionTime)
{
    Coze c;
    c.Update(MakeRecord("38", "XYZ", 20, At(2018, 6, 2)));
    c.Update(MakeRecord("38", "XYZ", 30, At(2018, 6, 3)));
    c.Update(MakeRecord("38", "XYZ", 10, At(2018, 6, 1)));

    EXPECT_EQ(c.first, 10u);
    EXPECT_EQ(c.last, 30u);
    EXPECT_EQ(c.starts, At(2018, 6, 1));
    EXPECT_EQ(c.ends, At(2018, 6, 3));
    EXPECT_EQ(c.Range(), std::make_pair(10u, 30u));
}

// Test: Equal acquisition times keep the later record
TEST(AggregatorTest, TiesGoToLaterRecord)
{
    Coze c;
    c.Update(MakeRecord("38", "XYZ", 1, At(2018, 6, 1)));
    c.Update(MakeRecord("38", "XYZ", 2, At(2018, 6, 1)));
    EXPECT_EQ(c.first, 2u);
    EXPECT_EQ(c.last, 2u);
}

// Test: Partition by UPI keeps sources apart, by source merges them
TEST(AggregatorTest, Partitioning)
{
    std::vector<Record> records = {
        MakeRecord("38", "XYZ", 1, At(2018, 6, 1)),
        MakeRecord("39", "XYZ", 1, At(2018, 6, 1)),
        MakeRecord("38", "ABC", 7, At(2018, 6, 1)),
    };

    Aggregator byUPI(ByUPI);
    Aggregator bySource(BySource);
    for (const auto &r : records) {
        byUPI.Update(r);
        bySource.Update(r);
    }

    EXPECT_EQ(byUPI.GetResults().size(), 3u);
    EXPECT_EQ(byUPI.GetResults().at("38/XYZ").count, 1u);
    EXPECT_EQ(byUPI.GetResults().at("39/XYZ").count, 1u);

    ASSERT_EQ(bySource.GetResults().size(), 2u);
    EXPECT_EQ(bySource.GetResults().at("38").count, 2u);
    EXPECT_EQ(bySource.GetResults().at("38").uniq, 2u);
}

// Test: Total sums every partition
TEST(AggregatorTest, TotalSumsPartitions)
{
    Aggregator aggregator;
    aggregator.Update(MakeRecord("38", "XYZ", 1, At(2018, 6, 1), true, 1 << 20));
    aggregator.Update(MakeRecord("39", "XYZ", 1, At(2018, 6, 1), false, 1 << 20));

    Coze total = aggregator.Total();
    EXPECT_EQ(total.count, 2u);
    EXPECT_EQ(total.uniq, 1u);
    EXPECT_EQ(total.invalid, 1u);
    EXPECT_EQ(total.size, 2u << 20);

    aggregator.Reset();
    EXPECT_TRUE(aggregator.GetResults().empty());
}

// Test: Consume drains a closed queue
TEST(AggregatorTest, ConsumeQueue)
{
    Archive::RecordQueue queue;
    for (uint32_t seq = 0; seq < 10; ++seq) {
        queue.Push(MakeRecord("38", "XYZ", seq, At(2018, 6, 1, 0, 0, seq)));
    }
    queue.Close();

    Aggregator aggregator;
    EXPECT_EQ(aggregator.Consume(queue), 10u);
    EXPECT_EQ(aggregator.GetResults().at("38/XYZ").uniq, 10u);
}
