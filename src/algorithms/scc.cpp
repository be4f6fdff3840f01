/**
 * @file scc.cpp
 * @brief Kosaraju SCC implementation with iterative DFS.
 * @author Dimitris Kafetzis
 *
 *   1. DFS the graph from every unvisited node in id order, recording
 *      nodes in post-order (finishing order).
 *   2. Transpose the graph.
 *   3. Pop nodes in reverse finishing order; each unvisited one roots a DFS
 *      over the transposed graph that collects exactly one component.
 */

#include "algorithms/scc.hpp"

#include <algorithm>
#include <stack>
#include <stdexcept>

namespace dep_planner {

namespace {

struct Frame {
    NodeId node;
    size_t edge_idx;
};

}  // namespace

size_t SccResult::cyclic_component_count() const noexcept {
    return static_cast<size_t>(std::count_if(components.begin(), components.end(),
        [](const Component& c) { return c.size() > 1; }));
}

SccResult SccEngine::find_sccs() const {
    Stopwatch stopwatch;
    const size_t n = graph_.node_count();

    SccResult result;
    result.component_of.assign(n, kInvalidNode);

    // ── Pass 1: finishing order ──────────────
    std::vector<bool> visited(n, false);
    std::vector<NodeId> finished;
    finished.reserve(n);

    for (NodeId root = 0; root < n; ++root) {
        if (!visited[root]) {
            finish_order(root, visited, finished, result.metrics);
        }
    }

    // ── Pass 2: transposed graph, reverse finishing order ──
    Graph transposed = graph_.transposed();
    std::fill(visited.begin(), visited.end(), false);

    ComponentId next_id = 0;
    while (!finished.empty()) {
        NodeId node = finished.back();
        finished.pop_back();
        if (!visited[node]) {
            collect_component(transposed, node, next_id++, visited, result);
        }
    }

    result.condensation = build_condensation(result);
    result.metrics.elapsed = stopwatch.elapsed();
    return result;
}

void SccEngine::finish_order(NodeId root, std::vector<bool>& visited,
                             std::vector<NodeId>& finished, RunMetrics& metrics) const {
    std::stack<Frame> dfs_stack;
    visited[root] = true;
    ++metrics.dfs_visits;
    dfs_stack.push({root, 0});

    while (!dfs_stack.empty()) {
        auto& [node, idx] = dfs_stack.top();
        auto edges = graph_.neighbors(node);

        if (idx >= edges.size()) {
            finished.push_back(node);
            dfs_stack.pop();
            continue;
        }

        NodeId next = edges[idx].target;
        ++idx;
        ++metrics.edge_traversals;

        if (!visited[next]) {
            visited[next] = true;
            ++metrics.dfs_visits;
            dfs_stack.push({next, 0});
        }
    }
}

void SccEngine::collect_component(const Graph& transposed, NodeId root, ComponentId id,
                                  std::vector<bool>& visited, SccResult& result) const {
    Component members;
    std::stack<Frame> dfs_stack;

    visited[root] = true;
    ++result.metrics.dfs_visits;
    result.component_of[root] = id;
    members.push_back(root);
    dfs_stack.push({root, 0});

    while (!dfs_stack.empty()) {
        auto& [node, idx] = dfs_stack.top();
        auto edges = transposed.neighbors(node);

        if (idx >= edges.size()) {
            dfs_stack.pop();
            continue;
        }

        NodeId next = edges[idx].target;
        ++idx;
        ++result.metrics.edge_traversals;

        if (!visited[next]) {
            visited[next] = true;
            ++result.metrics.dfs_visits;
            result.component_of[next] = id;
            members.push_back(next);
            dfs_stack.push({next, 0});
        }
    }

    result.components.push_back(std::move(members));
}

Graph SccEngine::build_condensation(const SccResult& result) const {
    const size_t count = result.components.size();
    Graph condensation(count, true);

    // last_source[c] == u_comp marks c as already linked from u_comp
    std::vector<ComponentId> last_source(count, kInvalidNode);

    for (ComponentId u_comp = 0; u_comp < count; ++u_comp) {
        for (NodeId u : result.components[u_comp]) {
            for (const auto& edge : graph_.neighbors(u)) {
                ComponentId v_comp = result.component_of[edge.target];
                if (v_comp == u_comp || last_source[v_comp] == u_comp) continue;

                last_source[v_comp] = u_comp;
                if (auto added = condensation.add_edge(u_comp, v_comp, edge.weight); !added) {
                    throw std::logic_error("Condensation edge rejected: " + added.error().message);
                }
            }
        }
    }

    return condensation;
}

}  // namespace dep_planner
