// Header first: it must compile on its own
#include "interval_allocator.hh"
#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>

namespace {

double Sum(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

TEST(IntervalAllocatorTest, ProportionalToScores) {
    IntervalAllocator allocator;
    auto deltas = allocator.Allocate({1.0, 3.0}, 40.0);
    ASSERT_EQ(deltas.size(), 2u);
    EXPECT_NEAR(deltas[0], 10.0, 1e-9);
    EXPECT_NEAR(deltas[1], 30.0, 1e-9);
}

TEST(IntervalAllocatorTest, SumMatchesBudgetForAwkwardSplits) {
    IntervalAllocator allocator;
    std::vector<double> scores = {0.13, 0.0071, 0.9, 0.33333, 0.5, 0.000001, 0.27};
    auto deltas = allocator.Allocate(scores, 3917.0);
    ASSERT_EQ(deltas.size(), scores.size());
    EXPECT_NEAR(Sum(deltas), 3917.0, 1e-6);
    for (double d : deltas) {
        EXPECT_GE(d, 0.0);
    }
}

TEST(IntervalAllocatorTest, AllZeroScoresSplitEvenly) {
    IntervalAllocator allocator;
    auto deltas = allocator.Allocate({0.0, 0.0, 0.0, 0.0}, 100.0);
    ASSERT_EQ(deltas.size(), 4u);
    for (double d : deltas) {
        EXPECT_NEAR(d, 25.0, 1e-9);
    }
}

TEST(IntervalAllocatorTest, EmptyScoresGiveEmptyAllocation) {
    IntervalAllocator allocator;
    EXPECT_TRUE(allocator.Allocate({}, 600.0).empty());
}

TEST(IntervalAllocatorTest, ZeroBudgetCollapsesEverything) {
    IntervalAllocator allocator(5.0);
    auto deltas = allocator.Allocate({0.2, 0.8}, 0.0);
    ASSERT_EQ(deltas.size(), 2u);
    EXPECT_DOUBLE_EQ(deltas[0], 0.0);
    EXPECT_DOUBLE_EQ(deltas[1], 0.0);
}

// -----------------------------------------------------------------------------
// Minimum-delta floor: small gaps are raised, the rest is re-split
// -----------------------------------------------------------------------------
TEST(IntervalAllocatorTest, FloorRenormalizesRemainingPairs) {
    IntervalAllocator allocator(10.0);
    // Unfloored this would be {1, 49.5, 49.5}
    auto deltas = allocator.Allocate({0.02, 0.99, 0.99}, 100.0);
    ASSERT_EQ(deltas.size(), 3u);
    EXPECT_NEAR(deltas[0], 10.0, 1e-9);
    EXPECT_NEAR(deltas[1], 45.0, 1e-9);
    EXPECT_NEAR(deltas[2], 45.0, 1e-9);
    EXPECT_NEAR(Sum(deltas), 100.0, 1e-9);
}

TEST(IntervalAllocatorTest, FloorCascadesUntilStable) {
    IntervalAllocator allocator(20.0);
    // Unfloored {0.41, 20.75, 78.8}: pinning the first gap pushes the
    // second to 16.7, so it gets pinned on the next pass
    auto deltas = allocator.Allocate({0.01, 0.5, 1.9}, 100.0);
    ASSERT_EQ(deltas.size(), 3u);
    EXPECT_NEAR(deltas[0], 20.0, 1e-9);
    EXPECT_NEAR(deltas[1], 20.0, 1e-9);
    EXPECT_NEAR(deltas[2], 60.0, 1e-9);
}

TEST(IntervalAllocatorTest, InfeasibleFloorFallsBackToEvenSplit) {
    IntervalAllocator allocator(50.0);
    auto deltas = allocator.Allocate({0.1, 0.5, 0.9}, 90.0);
    ASSERT_EQ(deltas.size(), 3u);
    for (double d : deltas) {
        EXPECT_NEAR(d, 30.0, 1e-9);
    }
}

TEST(IntervalAllocatorTest, RejectsNegativeInput) {
    IntervalAllocator allocator;
    EXPECT_THROW(allocator.Allocate({1.0}, -1.0), std::invalid_argument);
    EXPECT_THROW(allocator.Allocate({-0.5, 1.0}, 10.0), std::invalid_argument);
    EXPECT_THROW(allocator.SetMinDelta(-2.0), std::invalid_argument);
}

} // namespace
