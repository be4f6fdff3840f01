/**
 * @file test_graph_stats.cpp
 * @brief Unit tests for graph statistics helpers.
 * @author Dimitris Kafetzis
 */

#include "graph/graph_stats.hpp"
#include "graph/generator.hpp"

#include <gtest/gtest.h>

using namespace dep_planner;

TEST(GraphStatsTest, DensityOfTrivialGraphsIsZero) {
    EXPECT_DOUBLE_EQ(density(Graph{}), 0.0);
    EXPECT_DOUBLE_EQ(density(Graph{1}), 0.0);
}

TEST(GraphStatsTest, DensityDirected) {
    // 3 of 6 possible directed edges
    auto g = GraphGenerator::cycle(3, 1);
    EXPECT_DOUBLE_EQ(density(g), 0.5);
}

TEST(GraphStatsTest, SelfLoops) {
    EXPECT_FALSE(has_self_loops(GraphGenerator::linear_chain(4, 1)));
    EXPECT_TRUE(has_self_loops(GraphGenerator::cycle(1, 1)));
}

TEST(GraphStatsTest, ComputeStats) {
    Graph g(3);
    ASSERT_TRUE(g.add_edge(0, 1, 4).has_value());
    ASSERT_TRUE(g.add_edge(1, 2, -3).has_value());
    ASSERT_TRUE(g.add_edge(0, 2, 9).has_value());

    auto stats = compute_stats(g);
    EXPECT_EQ(stats.node_count, 3u);
    EXPECT_EQ(stats.edge_count, 3u);
    EXPECT_EQ(stats.min_weight, -3);
    EXPECT_EQ(stats.max_weight, 9);
    EXPECT_DOUBLE_EQ(stats.density, 0.5);
    EXPECT_NE(stats.to_string().find("nodes=3"), std::string::npos);
}

TEST(GraphStatsTest, NoEdgesHasZeroWeights) {
    auto stats = compute_stats(Graph{4});
    EXPECT_EQ(stats.min_weight, 0);
    EXPECT_EQ(stats.max_weight, 0);
}

TEST(GraphStatsTest, ValidateGraph) {
    auto g = GraphGenerator::diamond(2, 3, 1);
    EXPECT_TRUE(validate_graph(g).has_value());
}
