#include <gtest/gtest.h>
#include "../../src/client/latency_stats.h"

#include <chrono>

using namespace Occbench;
using std::chrono::microseconds;

TEST(LatencyStatsTest, EmptySummary) {
    LatencyStats stats;
    EXPECT_TRUE(stats.empty());
    LatencyStats::Summary s = stats.Summarize();
    EXPECT_EQ(s.count, 0u);
    EXPECT_DOUBLE_EQ(s.max_us, 0.0);
}

TEST(LatencyStatsTest, SmallValuesAreExact) {
    LatencyStats stats;
    for (long long us : {300, 100, 200, 200}) {
        stats.Record(microseconds(us));
    }
    LatencyStats::Summary s = stats.Summarize();
    EXPECT_EQ(s.count, 4u);
    EXPECT_DOUBLE_EQ(s.min_us, 100.0);
    EXPECT_DOUBLE_EQ(s.max_us, 300.0);
    EXPECT_DOUBLE_EQ(s.average_us, 200.0);
    EXPECT_DOUBLE_EQ(s.p50_us, 200.0);
    EXPECT_DOUBLE_EQ(s.p99_us, 300.0);
}

TEST(LatencyStatsTest, LargeValuesWithinBucketResolution) {
    LatencyStats stats;
    for (long long us = 1; us <= 100000; ++us) {
        stats.Record(microseconds(us));
    }
    LatencyStats::Summary s = stats.Summarize();
    EXPECT_EQ(s.count, 100000u);
    EXPECT_DOUBLE_EQ(s.max_us, 100000.0);
    EXPECT_LE(s.p50_us, 50000.0);
    EXPECT_GE(s.p50_us, 50000.0 * (1.0 - 1.0 / 64));
    EXPECT_LE(s.p99_us, 99000.0);
    EXPECT_GE(s.p99_us, 99000.0 * (1.0 - 1.0 / 64));
}

TEST(LatencyStatsTest, BucketBoundaries) {
    EXPECT_EQ(LatencyStats::BucketIndex(0), 0u);
    EXPECT_EQ(LatencyStats::BucketIndex(1023), 1023u);
    EXPECT_EQ(LatencyStats::BucketIndex(1024), 1024u);
    EXPECT_EQ(LatencyStats::BucketLowerBound(LatencyStats::BucketIndex(1024)), 1024u);
    EXPECT_EQ(LatencyStats::BucketIndex(2047), 1024u + 63u);
    EXPECT_EQ(LatencyStats::BucketIndex(2048), 1024u + 64u);
    EXPECT_LT(LatencyStats::BucketIndex(UINT64_MAX), LatencyStats::kBucketCount);
    for (uint64_t us : {uint64_t{5000}, uint64_t{123456}, uint64_t{987654321}}) {
        const uint64_t lower = LatencyStats::BucketLowerBound(LatencyStats::BucketIndex(us));
        EXPECT_LE(lower, us);
        EXPECT_GT(static_cast<double>(lower), static_cast<double>(us) * (1.0 - 1.0 / 64));
    }
}

TEST(LatencyStatsTest, MergeCombinesWorkers) {
    LatencyStats a;
    LatencyStats b;
    a.Record(microseconds(10));
    b.Record(microseconds(30));
    b.Record(microseconds(-5));
    a.Merge(b);
    LatencyStats::Summary s = a.Summarize();
    EXPECT_EQ(s.count, 3u);
    EXPECT_DOUBLE_EQ(s.min_us, 0.0);
    EXPECT_DOUBLE_EQ(s.max_us, 30.0);
    EXPECT_DOUBLE_EQ(s.p50_us, 10.0);
}
