#include <gtest/gtest.h>
#include "../../src/loadgen/id_partitioner.h"

using namespace Occbench;

TEST(IdPartitionerTest, EvenSplit) {
    for (int64_t i = 0; i < 4; ++i) {
        WorkerPartition p = ComputePartition(100, 4, i);
        EXPECT_FALSE(p.suppressed);
        EXPECT_EQ(p.range_size, 25);
        EXPECT_EQ(p.start_index, i * 25);
        EXPECT_EQ(p.end_index(), i * 25 + 24);
    }
}

TEST(IdPartitionerTest, RemainderIsNeverTargeted) {
    // 10 ids over 3 workers: ranges of 3, id 10 is left out.
    WorkerPartition last = ComputePartition(10, 3, 2);
    EXPECT_EQ(last.range_size, 3);
    EXPECT_EQ(last.start_index, 6);
    EXPECT_EQ(last.end_index(), 8);
}

TEST(IdPartitionerTest, PartitionsAreDisjoint) {
    const int64_t pool = 37;
    const int64_t workers = 5;
    for (int64_t a = 0; a < workers; ++a) {
        for (int64_t b = a + 1; b < workers; ++b) {
            WorkerPartition pa = ComputePartition(pool, workers, a);
            WorkerPartition pb = ComputePartition(pool, workers, b);
            EXPECT_TRUE(pa.end_index() < pb.start_index || pb.end_index() < pa.start_index);
        }
    }
}

TEST(IdPartitionerTest, MoreWorkersThanIdsSuppressesTheRest) {
    // ID_POOL_SIZE=10, 20 workers: workers 0..9 get one id each, 10..19 only
    // send fallback requests.
    for (int64_t i = 0; i < 10; ++i) {
        WorkerPartition p = ComputePartition(10, 20, i);
        EXPECT_FALSE(p.suppressed) << "worker " << i;
        EXPECT_EQ(p.range_size, 1);
        EXPECT_EQ(p.start_index, i);
    }
    for (int64_t i = 10; i < 20; ++i) {
        WorkerPartition p = ComputePartition(10, 20, i);
        EXPECT_TRUE(p.suppressed) << "worker " << i;
        EXPECT_EQ(p.range_size, 0);
    }
    EXPECT_EQ(ActiveWorkerCount(10, 20), 10);
}

TEST(IdPartitionerTest, NegativeIndexIsSuppressed) {
    EXPECT_TRUE(ComputePartition(10, 2, -1).suppressed);
}

TEST(IdPartitionerTest, NonPositiveSizesUseDefaults) {
    WorkerPartition p = ComputePartition(0, 0, 0);
    EXPECT_FALSE(p.suppressed);
    EXPECT_EQ(p.range_size, 10);
    EXPECT_EQ(p.start_index, 0);
    EXPECT_EQ(ActiveWorkerCount(-5, -5), 1);
}
