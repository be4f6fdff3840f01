/**
 * @file graph_loader.hpp
 * @brief Graph descriptors and their TOML deserialization.
 * @author Dimitris Kafetzis
 *
 * A descriptor file looks like:
 *
 *   name = "small_dag"
 *   directed = true
 *   n = 4
 *   source = 0
 *   weight_model = "edge"
 *   edges = [ { u = 0, v = 1, w = 2 }, { u = 1, v = 2, w = 3 } ]
 *
 * An edge without `w` has weight 1. `source` is optional.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/graph.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dep_planner {

struct EdgeDescriptor {
    NodeId u{0};
    NodeId v{0};
    Weight w{0};

    bool operator==(const EdgeDescriptor&) const = default;
};

/**
 * @brief In-memory form of a graph definition, before validation.
 */
struct GraphDescriptor {
    std::string name;
    bool directed = true;
    size_t n = 0;
    std::vector<EdgeDescriptor> edges;
    std::optional<NodeId> source;
    std::string weight_model = "edge";
};

/**
 * @brief Parse a descriptor from TOML text. @p name_hint is used when the
 *        document carries no `name` key.
 */
Result<GraphDescriptor> parse_graph_descriptor(std::string_view toml_text,
                                               std::string_view name_hint = "graph");

/**
 * @brief Load a descriptor from a TOML file; the file stem is the default name.
 */
Result<GraphDescriptor> load_graph_descriptor(const std::filesystem::path& path);

/**
 * @brief Build a Graph from a descriptor, rejecting undirected graphs and
 *        out-of-range endpoints or source.
 */
Result<Graph> build_graph(const GraphDescriptor& descriptor);

}  // namespace dep_planner
