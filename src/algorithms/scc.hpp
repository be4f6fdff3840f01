/**
 * @file scc.hpp
 * @brief Strongly connected components (Kosaraju) and condensation.
 * @author Dimitris Kafetzis
 *
 * Collapses every group of mutually dependent tasks into a single node so
 * the remaining graph is a DAG that can be ordered and measured.
 */

#pragma once

#include "core/types.hpp"
#include "graph/graph.hpp"

#include <vector>

namespace dep_planner {

using Component = std::vector<NodeId>;

/**
 * @brief Everything one SCC run produces.
 */
struct SccResult {
    /// Components in discovery order; members in second-pass visitation order.
    std::vector<Component> components;
    /// component_of[node] is the id of the component containing node.
    std::vector<ComponentId> component_of;
    /// One node per component, at most one edge per ordered component pair.
    Graph condensation;
    RunMetrics metrics;

    [[nodiscard]] size_t component_count() const noexcept { return components.size(); }

    /// Components with more than one member, i.e. genuine dependency cycles.
    [[nodiscard]] size_t cyclic_component_count() const noexcept;
};

/**
 * @brief Kosaraju's two-pass SCC algorithm over a read-only graph.
 *
 * Both passes use an explicit stack so deep graphs cannot overflow the call
 * stack. Complexity O(V + E).
 */
class SccEngine {
public:
    explicit SccEngine(const Graph& graph) noexcept : graph_(graph) {}

    [[nodiscard]] SccResult find_sccs() const;

private:
    void finish_order(NodeId root, std::vector<bool>& visited,
                      std::vector<NodeId>& finished, RunMetrics& metrics) const;
    void collect_component(const Graph& transposed, NodeId root, ComponentId id,
                           std::vector<bool>& visited, SccResult& result) const;
    [[nodiscard]] Graph build_condensation(const SccResult& result) const;

    const Graph& graph_;
};

}  // namespace dep_planner
