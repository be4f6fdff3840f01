/**
 * @file execution_planner.cpp
 * @brief ExecutionPlanner implementation.
 * @author Dimitris Kafetzis
 */

#include "planner/execution_planner.hpp"

#include "algorithms/topo_sort.hpp"

#include <algorithm>

namespace dep_planner {

size_t ExecutionPlan::cyclic_component_count() const noexcept {
    return static_cast<size_t>(std::count_if(components.begin(), components.end(),
        [](const Component& c) { return c.size() > 1; }));
}

std::vector<NodeId> expand_components(const std::vector<Component>& components,
                                      const std::vector<ComponentId>& ids) {
    std::vector<NodeId> tasks;
    for (ComponentId id : ids) {
        if (id < components.size()) {
            tasks.insert(tasks.end(), components[id].begin(), components[id].end());
        }
    }
    return tasks;
}

ExecutionPlanner::ExecutionPlanner(PlannerConfig config, Logger& logger,
                                   MetricsCollector& metrics)
    : config_(config), logger_(logger), metrics_(metrics) {}

Result<ExecutionPlan> ExecutionPlanner::plan(const Graph& graph, NodeId source,
                                             std::string_view name) {
    ExecutionPlan plan;
    plan.graph_name = std::string{name};
    plan.node_count = graph.node_count();
    plan.edge_count = graph.edge_count();
    plan.source = source;

    if (graph.node_count() == 0) {
        logger_.info(plan.graph_name + ": empty graph, nothing to plan");
        return plan;
    }
    if (!graph.contains(source)) {
        return Error{ErrorCode::OutOfRange,
                     "Source node " + std::to_string(source) + " is out of range [0, "
                     + std::to_string(graph.node_count()) + ")"};
    }

    // ── 1. Strongly connected components ─────
    SccEngine scc_engine(graph);
    auto scc = scc_engine.find_sccs();
    plan.metrics.scc = scc.metrics;
    metrics_.record_run(plan.graph_name, "scc", scc.metrics);
    metrics_.record_graph(plan.graph_name, plan.node_count, plan.edge_count,
                          scc.component_count(), scc.cyclic_component_count());
    logger_.info(plan.graph_name + ": " + std::to_string(scc.component_count())
                 + " components (" + std::to_string(scc.cyclic_component_count()) + " cyclic)");

    plan.components = std::move(scc.components);
    plan.component_of = std::move(scc.component_of);
    plan.condensation = std::move(scc.condensation);
    plan.source_component = plan.component_of[source];

    // ── 2. Topological order of the condensation ──
    TopologicalSorter sorter(plan.condensation);
    auto topo = sorter.topological_order();
    plan.metrics.topo = topo.metrics;
    metrics_.record_run(plan.graph_name, "topological_sort", topo.metrics);

    if (topo.order.empty()) {
        return Error{ErrorCode::CycleDetected,
                     plan.graph_name + ": condensation graph is not acyclic"};
    }
    plan.component_order = std::move(topo.order);
    plan.task_order = expand_components(plan.components, plan.component_order);
    logger_.debug(plan.graph_name + ": component order computed ("
                  + std::to_string(plan.component_order.size()) + " components)");

    // ── 3. Shortest and longest distances ────
    DagPathEngine paths(plan.condensation, config_.critical_path_policy);

    auto shortest = paths.shortest_paths(plan.source_component, plan.component_order);
    if (!shortest) return shortest.error();
    plan.shortest = std::move(shortest->distances);
    plan.metrics.shortest_paths = shortest->metrics;
    metrics_.record_run(plan.graph_name, "shortest_paths", shortest->metrics);

    auto critical = paths.find_critical_path(plan.source_component, plan.component_order);
    if (!critical) return critical.error();
    if (const auto& longest = paths.last_result()) {
        plan.longest = longest->distances;
    }
    plan.metrics.longest_paths = critical->metrics;
    metrics_.record_run(plan.graph_name, "longest_paths", critical->metrics);

    plan.critical_path = std::move(*critical);
    plan.critical_tasks = expand_components(plan.components, plan.critical_path.nodes);
    logger_.info(plan.graph_name + ": critical path length "
                 + std::to_string(plan.critical_path.length) + " over "
                 + std::to_string(plan.critical_path.nodes.size()) + " components");

    return plan;
}

}  // namespace dep_planner
