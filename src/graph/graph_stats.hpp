/**
 * @file graph_stats.hpp
 * @brief Structural statistics and validation helpers for Graph.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "graph/graph.hpp"

#include <string>

namespace dep_planner {

struct GraphStats {
    size_t node_count{0};
    size_t edge_count{0};
    Weight min_weight{0};        ///< 0 when the graph has no edges
    Weight max_weight{0};        ///< 0 when the graph has no edges
    double density{0.0};

    [[nodiscard]] std::string to_string() const;
};

/// E / (n(n-1)) for directed graphs, E / (n(n-1)/2) otherwise; 0 for n <= 1.
[[nodiscard]] double density(const Graph& graph) noexcept;

[[nodiscard]] bool has_self_loops(const Graph& graph) noexcept;

[[nodiscard]] GraphStats compute_stats(const Graph& graph) noexcept;

/// Re-checks every edge endpoint against [0, n).
Result<void> validate_graph(const Graph& graph);

}  // namespace dep_planner
