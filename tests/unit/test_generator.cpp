/**
 * @file test_generator.cpp
 * @brief Unit tests for GraphGenerator.
 * @author Dimitris Kafetzis
 */

#include "graph/generator.hpp"
#include "graph/graph_stats.hpp"

#include <gtest/gtest.h>
#include <random>
#include <stdexcept>

using namespace dep_planner;

// ─── Linear Chain ────────────────────────────

TEST(GeneratorTest, LinearChainShape) {
    auto g = GraphGenerator::linear_chain(5, 3);
    EXPECT_EQ(g.node_count(), 5u);
    EXPECT_EQ(g.edge_count(), 4u);
    for (NodeId u = 0; u + 1 < 5; ++u) {
        ASSERT_EQ(g.neighbors(u).size(), 1u);
        EXPECT_EQ(g.neighbors(u)[0], (Edge{u + 1, 3}));
    }
    EXPECT_TRUE(g.neighbors(4).empty());
}

TEST(GeneratorTest, LinearChainSingleNode) {
    auto g = GraphGenerator::linear_chain(1, 1);
    EXPECT_EQ(g.node_count(), 1u);
    EXPECT_EQ(g.edge_count(), 0u);
}

// ─── Cycle ───────────────────────────────────

TEST(GeneratorTest, CycleClosesBackToZero) {
    auto g = GraphGenerator::cycle(4, 2);
    EXPECT_EQ(g.edge_count(), 4u);
    EXPECT_EQ(g.neighbors(3)[0].target, 0u);
}

TEST(GeneratorTest, CycleOfOneIsSelfLoop) {
    auto g = GraphGenerator::cycle(1, 1);
    EXPECT_TRUE(has_self_loops(g));
}

// ─── Diamond ─────────────────────────────────

TEST(GeneratorTest, DiamondNodeAndEdgeCount) {
    auto g = GraphGenerator::diamond(2, 3, 1);
    // 1 + depth * (width + 1)
    EXPECT_EQ(g.node_count(), 9u);
    // Each stage: width fan-out + width fan-in
    EXPECT_EQ(g.edge_count(), 12u);
    EXPECT_EQ(g.neighbors(0).size(), 3u);
}

TEST(GeneratorTest, DiamondZeroWidthIsChain) {
    auto g = GraphGenerator::diamond(3, 0, 1);
    EXPECT_EQ(g.node_count(), 4u);
    EXPECT_EQ(g.edge_count(), 3u);
}

// ─── Cycle Chain ─────────────────────────────

TEST(GeneratorTest, CycleChainLinksConsecutiveCycles) {
    auto g = GraphGenerator::cycle_chain(3, 3, 1);
    EXPECT_EQ(g.node_count(), 9u);
    // 3 edges per cycle + 2 links
    EXPECT_EQ(g.edge_count(), 11u);
    ASSERT_EQ(g.neighbors(2).size(), 2u);
    EXPECT_EQ(g.neighbors(2)[1].target, 3u);
}

// ─── Random ──────────────────────────────────

TEST(GeneratorTest, RandomGraphHasNoSelfLoopsAndRespectsWeights) {
    std::mt19937 rng(42);
    auto g = GraphGenerator::random_graph(30, 0.2f, -5, 10, rng);
    EXPECT_EQ(g.node_count(), 30u);
    EXPECT_FALSE(has_self_loops(g));

    auto stats = compute_stats(g);
    if (stats.edge_count > 0) {
        EXPECT_GE(stats.min_weight, -5);
        EXPECT_LE(stats.max_weight, 10);
    }
}

TEST(GeneratorTest, RandomDagEdgesGoForward) {
    std::mt19937 rng(7);
    auto g = GraphGenerator::random_dag(40, 0.3f, 1, 9, rng);
    for (NodeId u = 0; u < g.node_count(); ++u) {
        for (const auto& edge : g.neighbors(u)) {
            EXPECT_LT(u, edge.target);
        }
    }
}

TEST(GeneratorTest, RandomIsDeterministicForSeed) {
    std::mt19937 rng_a(123);
    std::mt19937 rng_b(123);
    auto a = GraphGenerator::random_graph(20, 0.25f, 1, 5, rng_a);
    auto b = GraphGenerator::random_graph(20, 0.25f, 1, 5, rng_b);
    EXPECT_EQ(a.to_string(), b.to_string());
}

TEST(GeneratorTest, InvertedWeightRangeThrows) {
    std::mt19937 rng(1);
    EXPECT_THROW(GraphGenerator::random_graph(5, 0.5f, 10, 1, rng), std::invalid_argument);
    EXPECT_THROW(GraphGenerator::random_dag(5, 0.5f, 3, 2, rng), std::invalid_argument);
    EXPECT_NO_THROW(GraphGenerator::random_dag(5, 0.5f, 4, 4, rng));
}
