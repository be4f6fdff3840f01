/**
 * @file generator.hpp
 * @brief Synthetic task graphs for testing and benchmarking.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "graph/graph.hpp"

#include <random>

namespace dep_planner {

/**
 * @brief Factory for synthetic graphs with various topologies.
 */
class GraphGenerator {
public:
    /// Linear chain: 0 → 1 → ... → n-1
    static Graph linear_chain(size_t num_nodes, Weight weight);

    /// Single cycle: 0 → 1 → ... → n-1 → 0
    static Graph cycle(size_t num_nodes, Weight weight);

    /// Repeated fan-out/fan-in; `depth` stages of `width` parallel branches
    static Graph diamond(size_t depth, size_t width, Weight weight);

    /// `num_cycles` cycles of `cycle_size` nodes, each linked to the next one
    static Graph cycle_chain(size_t num_cycles, size_t cycle_size, Weight weight);

    /// Random directed graph (cycles allowed, no self-loops).
    /// Throws std::invalid_argument when min_weight > max_weight.
    static Graph random_graph(size_t num_nodes,
                              float edge_probability,
                              Weight min_weight,
                              Weight max_weight,
                              std::mt19937& rng);

    /// Random DAG; edges only go from lower to higher id.
    /// Throws std::invalid_argument when min_weight > max_weight.
    static Graph random_dag(size_t num_nodes,
                            float edge_probability,
                            Weight min_weight,
                            Weight max_weight,
                            std::mt19937& rng);
};

}  // namespace dep_planner
