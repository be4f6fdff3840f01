/**
 * @file topo_sort.cpp
 * @brief Kahn's algorithm over the adjacency lists, O(V + E).
 * @author Dimitris Kafetzis
 */

#include "algorithms/topo_sort.hpp"

#include <queue>

namespace dep_planner {

TopoResult TopologicalSorter::topological_order() const {
    Stopwatch stopwatch;
    const size_t n = graph_.node_count();
    TopoResult result;

    std::vector<size_t> in_degree(n, 0);
    for (NodeId u = 0; u < n; ++u) {
        for (const auto& edge : graph_.neighbors(u)) {
            ++in_degree[edge.target];
        }
    }

    std::queue<NodeId> zero_in;
    for (NodeId u = 0; u < n; ++u) {
        if (in_degree[u] == 0) {
            zero_in.push(u);
            ++result.metrics.queue_pushes;
        }
    }

    result.order.reserve(n);
    while (!zero_in.empty()) {
        NodeId current = zero_in.front();
        zero_in.pop();
        ++result.metrics.queue_pops;
        result.order.push_back(current);

        for (const auto& edge : graph_.neighbors(current)) {
            if (--in_degree[edge.target] == 0) {
                zero_in.push(edge.target);
                ++result.metrics.queue_pushes;
            }
        }
    }

    // Nodes left with in-degree > 0 sit on a cycle
    if (result.order.size() != n) {
        result.order.clear();
    }

    result.metrics.elapsed = stopwatch.elapsed();
    return result;
}

bool TopologicalSorter::is_dag() const {
    return !topological_order().order.empty();
}

}  // namespace dep_planner
