/**
 * @file dag_paths.hpp
 * @brief Single-source shortest/longest paths and critical path on a DAG.
 * @author Dimitris Kafetzis
 *
 * Distances are relaxed in topological order starting at the source's
 * position, so each edge is examined at most once per run. Nodes placed
 * before the source in the order are never visited.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/graph.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dep_planner {

/**
 * @brief Distances and predecessor links from one path computation.
 */
struct PathResult {
    NodeId source{0};
    DistanceVector distances;
    /// predecessor[v] is the node before v on the best path, kInvalidNode if none.
    std::vector<NodeId> predecessor;
    RunMetrics metrics;
};

/**
 * @brief Maximum-weight path from the source to its farthest reachable node.
 */
struct CriticalPath {
    int64_t length{0};
    std::vector<NodeId> nodes;
    RunMetrics metrics;

    [[nodiscard]] std::string to_string() const;
};

class DagPathEngine {
public:
    explicit DagPathEngine(const Graph& graph,
                           CriticalPathPolicy policy = CriticalPathPolicy::EmptyPath) noexcept
        : graph_(graph), policy_(policy) {}

    /// Errors: OutOfRange source, InvalidOrder when @p order is not a permutation of the
    /// nodes or some edge points backwards in it.
    Result<PathResult> shortest_paths(NodeId source, std::span<const NodeId> order);
    Result<PathResult> longest_paths(NodeId source, std::span<const NodeId> order);

    /**
     * @brief Node sequence source → target from the most recent computation.
     *
     * InvalidState before any computation, OutOfRange for a bad target,
     * empty when the target is unreachable.
     */
    Result<std::vector<NodeId>> reconstruct_path(NodeId target) const;

    /**
     * @brief Longest paths, then the path to the farthest node (ties: lowest id).
     *
     * When nothing is strictly farther than the source, the result follows
     * the configured CriticalPathPolicy.
     */
    Result<CriticalPath> find_critical_path(NodeId source, std::span<const NodeId> order);

    [[nodiscard]] const std::optional<PathResult>& last_result() const noexcept { return last_; }
    [[nodiscard]] CriticalPathPolicy policy() const noexcept { return policy_; }

private:
    enum class Objective : uint8_t { Shortest, Longest };

    [[nodiscard]] Result<size_t> validate(NodeId source, std::span<const NodeId> order) const;
    Result<PathResult> run(NodeId source, std::span<const NodeId> order, Objective objective);

    const Graph& graph_;
    CriticalPathPolicy policy_;
    std::optional<PathResult> last_;
};

}  // namespace dep_planner
