/**
 * @file graph.hpp
 * @brief Append-only weighted directed graph over dense integer ids.
 * @author Dimitris Kafetzis
 *
 * Nodes are the integers [0, n). Each node keeps its outgoing edges in
 * insertion order; that order drives DFS exploration and therefore the
 * tie-breaking of every algorithm built on top of the graph.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace dep_planner {

/**
 * @brief Outgoing edge stored in a node's adjacency list.
 */
struct Edge {
    NodeId target{0};
    Weight weight{0};

    bool operator==(const Edge&) const = default;
};

/**
 * @brief Directed graph with integer node ids and integer edge weights.
 */
class Graph {
public:
    explicit Graph(size_t node_count = 0, bool directed = true);

    // ── Construction ──────────────────────────
    /// Append u → v; fails with OutOfRange if either endpoint is not in [0, n).
    Result<void> add_edge(NodeId u, NodeId v, Weight w);

    // ── Queries ───────────────────────────────
    /// Outgoing edges of a valid node in insertion order.
    [[nodiscard]] std::span<const Edge> neighbors(NodeId node) const;
    [[nodiscard]] size_t node_count() const noexcept { return adjacency_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edge_count_; }
    [[nodiscard]] bool is_directed() const noexcept { return directed_; }
    [[nodiscard]] bool contains(NodeId node) const noexcept {
        return static_cast<size_t>(node) < adjacency_.size();
    }

    /// Same nodes, every edge reversed, weights preserved.
    [[nodiscard]] Graph transposed() const;

    [[nodiscard]] std::string to_string() const;

private:
    std::vector<std::vector<Edge>> adjacency_;
    size_t edge_count_{0};
    bool directed_;
};

}  // namespace dep_planner
