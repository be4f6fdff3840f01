/**
 * @file generator.cpp
 * @brief Synthetic graph generator — all topology implementations.
 * @author Dimitris Kafetzis
 *
 * Generates graphs that model common task-dependency patterns:
 * - Linear chains (sequential pipelines)
 * - Cycles and chains of cycles (mutually dependent task groups)
 * - Diamonds (repeated fork/join stages)
 * - Random graphs and random DAGs (stress testing and benchmarking)
 */

#include "graph/generator.hpp"

#include <stdexcept>
#include <string>

namespace dep_planner {

namespace {

void check_weight_range(Weight min_weight, Weight max_weight) {
    if (min_weight > max_weight) {
        throw std::invalid_argument("min_weight " + std::to_string(min_weight)
                                    + " exceeds max_weight " + std::to_string(max_weight));
    }
}

/// Endpoints are in range by construction; a failure is a generator bug.
void link(Graph& graph, size_t u, size_t v, Weight weight) {
    auto added = graph.add_edge(static_cast<NodeId>(u), static_cast<NodeId>(v), weight);
    if (!added) throw std::logic_error(added.error().message);
}

}  // namespace

// ─────────────────────────────────────────────
// Linear Chain: 0 → 1 → 2 → ... → n-1
// ─────────────────────────────────────────────

Graph GraphGenerator::linear_chain(size_t num_nodes, Weight weight) {
    Graph graph(num_nodes);
    for (size_t i = 1; i < num_nodes; ++i) {
        link(graph, i - 1, i, weight);
    }
    return graph;
}

// ─────────────────────────────────────────────
// Cycle: 0 → 1 → ... → n-1 → 0
// A single node yields a self-loop.
// ─────────────────────────────────────────────

Graph GraphGenerator::cycle(size_t num_nodes, Weight weight) {
    Graph graph(num_nodes);
    for (size_t i = 0; i < num_nodes; ++i) {
        link(graph, i, (i + 1) % num_nodes, weight);
    }
    return graph;
}

// ─────────────────────────────────────────────
// Diamond: repeated fork/join.
//
//   Stage 1:        0
//              /    |    \      [fan-out]
//            1      2     3
//              \    |    /      [fan-in]
//                   4
//   Stage 2:   /    |    \      ...
//
// Node count = 1 + depth * (width + 1)
// ─────────────────────────────────────────────

Graph GraphGenerator::diamond(size_t depth, size_t width, Weight weight) {
    Graph graph(1 + depth * (width + 1));

    size_t join = 0;
    for (size_t d = 0; d < depth; ++d) {
        size_t first_branch = join + 1;
        size_t next_join = first_branch + width;
        for (size_t b = 0; b < width; ++b) {
            link(graph, join, first_branch + b, weight);
            link(graph, first_branch + b, next_join, weight);
        }
        if (width == 0) {
            link(graph, join, next_join, weight);
        }
        join = next_join;
    }
    return graph;
}

// ─────────────────────────────────────────────
// Cycle chain: C0 → C1 → ... → Ck-1, each Ci a directed cycle.
// The last node of Ci links to the first node of Ci+1.
// ─────────────────────────────────────────────

Graph GraphGenerator::cycle_chain(size_t num_cycles, size_t cycle_size, Weight weight) {
    Graph graph(num_cycles * cycle_size);
    if (cycle_size == 0) return graph;

    for (size_t c = 0; c < num_cycles; ++c) {
        size_t base = c * cycle_size;
        for (size_t i = 0; i < cycle_size; ++i) {
            link(graph, base + i, base + (i + 1) % cycle_size, weight);
        }
        if (c + 1 < num_cycles) {
            link(graph, base + cycle_size - 1, base + cycle_size, weight);
        }
    }
    return graph;
}

// ─────────────────────────────────────────────
// Random graphs (Erdős–Rényi-style edges with uniform weights)
// ─────────────────────────────────────────────

Graph GraphGenerator::random_graph(size_t num_nodes,
                                   float edge_probability,
                                   Weight min_weight,
                                   Weight max_weight,
                                   std::mt19937& rng) {
    check_weight_range(min_weight, max_weight);
    Graph graph(num_nodes);
    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    std::uniform_int_distribution<Weight> weight_dist(min_weight, max_weight);

    for (size_t i = 0; i < num_nodes; ++i) {
        for (size_t j = 0; j < num_nodes; ++j) {
            if (i != j && edge_dist(rng) < edge_probability) {
                link(graph, i, j, weight_dist(rng));
            }
        }
    }
    return graph;
}

Graph GraphGenerator::random_dag(size_t num_nodes,
                                 float edge_probability,
                                 Weight min_weight,
                                 Weight max_weight,
                                 std::mt19937& rng) {
    check_weight_range(min_weight, max_weight);
    Graph graph(num_nodes);
    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    std::uniform_int_distribution<Weight> weight_dist(min_weight, max_weight);

    // Only lower → higher id, so the result is acyclic
    for (size_t i = 0; i < num_nodes; ++i) {
        for (size_t j = i + 1; j < num_nodes; ++j) {
            if (edge_dist(rng) < edge_probability) {
                link(graph, i, j, weight_dist(rng));
            }
        }
    }
    return graph;
}

}  // namespace dep_planner
