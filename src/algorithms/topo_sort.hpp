/**
 * @file topo_sort.hpp
 * @brief Kahn's topological sort.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "graph/graph.hpp"

#include <vector>

namespace dep_planner {

struct TopoResult {
    /// Empty when the graph contains a cycle (or has no nodes).
    std::vector<NodeId> order;
    RunMetrics metrics;
};

/**
 * @brief Orders the nodes of a graph so every edge points forward.
 *
 * Meant for condensation graphs. A cycle is signalled by an empty order,
 * not by an error, so callers must check the length before using it. An
 * empty graph also yields an empty order; callers treat n = 0 as acyclic.
 */
class TopologicalSorter {
public:
    explicit TopologicalSorter(const Graph& graph) noexcept : graph_(graph) {}

    /// FIFO Kahn's algorithm, zero in-degree nodes seeded in id order.
    [[nodiscard]] TopoResult topological_order() const;

    /// Non-empty order produced. Recomputes the sort on every call.
    [[nodiscard]] bool is_dag() const;

private:
    const Graph& graph_;
};

}  // namespace dep_planner
