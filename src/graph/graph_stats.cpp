/**
 * @file graph_stats.cpp
 * @brief Graph statistics implementation.
 * @author Dimitris Kafetzis
 */

#include "graph/graph_stats.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dep_planner {

std::string GraphStats::to_string() const {
    std::ostringstream oss;
    oss << "GraphStats{nodes=" << node_count
        << ", edges=" << edge_count
        << ", weight=[" << min_weight << "," << max_weight << "]"
        << ", density=" << std::fixed << std::setprecision(3) << density << "}";
    return oss.str();
}

double density(const Graph& graph) noexcept {
    auto n = static_cast<double>(graph.node_count());
    if (graph.node_count() <= 1) return 0.0;

    double max_edges = graph.is_directed() ? n * (n - 1.0) : n * (n - 1.0) / 2.0;
    return static_cast<double>(graph.edge_count()) / max_edges;
}

bool has_self_loops(const Graph& graph) noexcept {
    for (NodeId u = 0; u < graph.node_count(); ++u) {
        for (const auto& edge : graph.neighbors(u)) {
            if (edge.target == u) return true;
        }
    }
    return false;
}

GraphStats compute_stats(const Graph& graph) noexcept {
    GraphStats stats;
    stats.node_count = graph.node_count();
    stats.edge_count = graph.edge_count();
    stats.density = density(graph);

    bool first = true;
    for (NodeId u = 0; u < graph.node_count(); ++u) {
        for (const auto& edge : graph.neighbors(u)) {
            if (first) {
                stats.min_weight = stats.max_weight = edge.weight;
                first = false;
            } else {
                stats.min_weight = std::min(stats.min_weight, edge.weight);
                stats.max_weight = std::max(stats.max_weight, edge.weight);
            }
        }
    }
    return stats;
}

Result<void> validate_graph(const Graph& graph) {
    for (NodeId u = 0; u < graph.node_count(); ++u) {
        for (const auto& edge : graph.neighbors(u)) {
            if (!graph.contains(edge.target)) {
                return Error{ErrorCode::OutOfRange,
                             "Node " + std::to_string(u) + " has edge to invalid node "
                             + std::to_string(edge.target)};
            }
        }
    }
    return {};
}

}  // namespace dep_planner
