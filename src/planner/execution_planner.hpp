/**
 * @file execution_planner.hpp
 * @brief End-to-end dependency planning for one task graph.
 * @author Dimitris Kafetzis
 *
 * Pipeline:  Graph → SCC + condensation → topological order of components
 *            → shortest / longest distances → critical path
 *
 * Component-level results are mapped back to task ids: the task execution
 * order lists each component's members in component order, and the critical
 * task sequence expands every component on the critical path.
 */

#pragma once

#include "algorithms/dag_paths.hpp"
#include "algorithms/scc.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/graph.hpp"
#include "telemetry/metrics_collector.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dep_planner {

/**
 * @brief Per-stage counters of one planning run.
 */
struct StageMetrics {
    RunMetrics scc;
    RunMetrics topo;
    RunMetrics shortest_paths;
    RunMetrics longest_paths;

    [[nodiscard]] Duration total_elapsed() const noexcept {
        return scc.elapsed + topo.elapsed + shortest_paths.elapsed + longest_paths.elapsed;
    }
};

/**
 * @brief Everything the planner computes for one graph.
 */
struct ExecutionPlan {
    std::string graph_name;
    size_t node_count{0};
    size_t edge_count{0};

    NodeId source{0};
    ComponentId source_component{0};

    std::vector<Component> components;
    std::vector<ComponentId> component_of;
    Graph condensation;

    std::vector<ComponentId> component_order;
    std::vector<NodeId> task_order;

    /// Indexed by component id.
    DistanceVector shortest;
    DistanceVector longest;

    CriticalPath critical_path;
    std::vector<NodeId> critical_tasks;

    StageMetrics metrics;

    [[nodiscard]] size_t cyclic_component_count() const noexcept;
    [[nodiscard]] bool has_cycles() const noexcept { return cyclic_component_count() > 0; }
};

/**
 * @brief Runs the planning pipeline and reports each stage to the logger and
 *        the metrics collector.
 */
class ExecutionPlanner {
public:
    ExecutionPlanner(PlannerConfig config, Logger& logger, MetricsCollector& metrics);

    /**
     * @brief Plan @p graph from task @p source.
     *
     * Errors: OutOfRange for a bad source on a non-empty graph, CycleDetected
     * if the condensation cannot be ordered. An empty graph yields an empty plan.
     */
    Result<ExecutionPlan> plan(const Graph& graph, NodeId source, std::string_view name = "graph");

private:
    PlannerConfig config_;
    Logger& logger_;
    MetricsCollector& metrics_;
};

/// Concatenate the members of @p ids' components, in the order given.
[[nodiscard]] std::vector<NodeId> expand_components(const std::vector<Component>& components,
                                                    const std::vector<ComponentId>& ids);

}  // namespace dep_planner
