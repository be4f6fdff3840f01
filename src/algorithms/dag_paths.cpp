/**
 * @file dag_paths.cpp
 * @brief DAG path engine implementation.
 * @author Dimitris Kafetzis
 */

#include "algorithms/dag_paths.hpp"

#include <algorithm>
#include <sstream>

namespace dep_planner {

std::string CriticalPath::to_string() const {
    std::ostringstream oss;
    oss << "CriticalPath{length=" << length << ", path=[";
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << nodes[i];
    }
    oss << "]}";
    return oss.str();
}

Result<size_t> DagPathEngine::validate(NodeId source, std::span<const NodeId> order) const {
    const size_t n = graph_.node_count();
    if (!graph_.contains(source)) {
        return Error{ErrorCode::OutOfRange,
                     "Source node " + std::to_string(source) + " is out of range [0, "
                     + std::to_string(n) + ")"};
    }
    if (order.size() != n) {
        return Error{ErrorCode::InvalidOrder,
                     "Invalid topological order: " + std::to_string(order.size())
                     + " entries for " + std::to_string(n) + " nodes (graph may contain cycles)"};
    }

    std::vector<size_t> position(n, n);
    for (size_t i = 0; i < order.size(); ++i) {
        NodeId node = order[i];
        if (!graph_.contains(node) || position[node] != n) {
            return Error{ErrorCode::InvalidOrder,
                         "Topological order is not a permutation of the graph's nodes"};
        }
        position[node] = i;
    }

    // Every edge must point forward, otherwise predecessor links can form a loop
    for (NodeId u = 0; u < n; ++u) {
        for (const auto& edge : graph_.neighbors(u)) {
            if (position[u] >= position[edge.target]) {
                return Error{ErrorCode::InvalidOrder,
                             "Invalid topological order: edge " + std::to_string(u) + " -> "
                             + std::to_string(edge.target) + " points backwards"};
            }
        }
    }

    return position[source];
}

Result<PathResult> DagPathEngine::run(NodeId source, std::span<const NodeId> order,
                                      Objective objective) {
    auto source_pos = validate(source, order);
    if (!source_pos) return source_pos.error();

    Stopwatch stopwatch;
    const size_t n = graph_.node_count();

    PathResult result;
    result.source = source;
    result.distances.assign(n, Distance::unreachable());
    result.predecessor.assign(n, kInvalidNode);
    result.distances[source] = Distance::of(0);

    for (size_t i = *source_pos; i < order.size(); ++i) {
        NodeId u = order[i];
        const Distance du = result.distances[u];
        if (!du.reachable()) continue;

        for (const auto& edge : graph_.neighbors(u)) {
            ++result.metrics.relax_operations;

            Distance candidate = du + edge.weight;
            Distance& current = result.distances[edge.target];
            bool improves = objective == Objective::Shortest
                ? candidate.shorter_than(current)
                : candidate.longer_than(current);

            if (improves) {
                current = candidate;
                result.predecessor[edge.target] = u;
            }
        }
    }

    result.metrics.elapsed = stopwatch.elapsed();
    last_ = result;
    return result;
}

Result<PathResult> DagPathEngine::shortest_paths(NodeId source, std::span<const NodeId> order) {
    return run(source, order, Objective::Shortest);
}

Result<PathResult> DagPathEngine::longest_paths(NodeId source, std::span<const NodeId> order) {
    return run(source, order, Objective::Longest);
}

Result<std::vector<NodeId>> DagPathEngine::reconstruct_path(NodeId target) const {
    if (!last_) {
        return Error{ErrorCode::InvalidState, "Must compute paths before reconstructing"};
    }
    if (!graph_.contains(target)) {
        return Error{ErrorCode::OutOfRange,
                     "Target node " + std::to_string(target) + " is out of range"};
    }

    std::vector<NodeId> path;
    if (!last_->distances[target].reachable()) {
        return path;
    }

    for (NodeId at = target; at != kInvalidNode; at = last_->predecessor[at]) {
        path.push_back(at);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

Result<CriticalPath> DagPathEngine::find_critical_path(NodeId source,
                                                       std::span<const NodeId> order) {
    Stopwatch stopwatch;
    auto longest = longest_paths(source, order);
    if (!longest) return longest.error();

    const auto& dist = longest->distances;
    NodeId farthest = kInvalidNode;
    for (NodeId v = 0; v < dist.size(); ++v) {
        if (dist[v].reachable()
            && (farthest == kInvalidNode || dist[v].value() > dist[farthest].value())) {
            farthest = v;
        }
    }

    CriticalPath critical;
    critical.metrics = longest->metrics;

    if (farthest == kInvalidNode || farthest == source) {
        if (policy_ == CriticalPathPolicy::SourceOnly) {
            critical.nodes.push_back(source);
        }
    } else {
        auto path = reconstruct_path(farthest);
        if (!path) return path.error();
        critical.length = dist[farthest].value();
        critical.nodes = std::move(*path);
    }

    critical.metrics.elapsed = stopwatch.elapsed();
    return critical;
}

}  // namespace dep_planner
