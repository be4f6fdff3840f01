/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace dep_planner;

TEST(DistanceTest, DefaultIsUnreachable) {
    Distance d;
    EXPECT_FALSE(d.reachable());
    EXPECT_EQ(d, Distance::unreachable());
}

TEST(DistanceTest, FiniteValue) {
    auto d = Distance::of(42);
    ASSERT_TRUE(d.reachable());
    EXPECT_EQ(d.value(), 42);
}

TEST(DistanceTest, AdditionShortCircuitsOnUnreachable) {
    auto sum = Distance::unreachable() + 5;
    EXPECT_FALSE(sum.reachable());
}

TEST(DistanceTest, AdditionIsWideEnoughForInt32Weights) {
    auto d = Distance::of(std::numeric_limits<Weight>::max()) + std::numeric_limits<Weight>::max();
    ASSERT_TRUE(d.reachable());
    EXPECT_EQ(d.value(), 2 * static_cast<int64_t>(std::numeric_limits<Weight>::max()));
}

TEST(DistanceTest, NegativeWeights) {
    auto d = Distance::of(3) + (-5);
    EXPECT_EQ(d.value(), -2);
}

TEST(DistanceTest, ShorterThan) {
    EXPECT_TRUE(Distance::of(1).shorter_than(Distance::of(2)));
    EXPECT_FALSE(Distance::of(2).shorter_than(Distance::of(2)));
    EXPECT_TRUE(Distance::of(1'000'000).shorter_than(Distance::unreachable()));
    EXPECT_FALSE(Distance::unreachable().shorter_than(Distance::of(0)));
    EXPECT_FALSE(Distance::unreachable().shorter_than(Distance::unreachable()));
}

TEST(DistanceTest, LongerThan) {
    EXPECT_TRUE(Distance::of(3).longer_than(Distance::of(2)));
    EXPECT_FALSE(Distance::of(2).longer_than(Distance::of(2)));
    EXPECT_TRUE(Distance::of(-1'000'000).longer_than(Distance::unreachable()));
    EXPECT_FALSE(Distance::unreachable().longer_than(Distance::of(0)));
}

TEST(RunMetricsTest, TotalsAndMilliseconds) {
    RunMetrics m;
    m.dfs_visits = 3;
    m.edge_traversals = 4;
    m.queue_pushes = 1;
    m.queue_pops = 1;
    m.relax_operations = 2;
    m.elapsed = std::chrono::milliseconds{5};

    EXPECT_EQ(m.total_operations(), 11u);
    EXPECT_DOUBLE_EQ(m.elapsed_ms(), 5.0);
}

TEST(StopwatchTest, ElapsedIsNonNegative) {
    Stopwatch sw;
    EXPECT_GE(sw.elapsed().count(), 0);
}

TEST(CriticalPathPolicyTest, ToString) {
    EXPECT_EQ(to_string(CriticalPathPolicy::EmptyPath), "empty");
    EXPECT_EQ(to_string(CriticalPathPolicy::SourceOnly), "source");
}
