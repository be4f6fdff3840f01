/**
 * @file graph_loader.cpp
 * @brief TOML graph descriptor parsing using toml++.
 * @author Dimitris Kafetzis
 */

#include "graph/graph_loader.hpp"

#include <limits>

#include <toml++/toml.hpp>

namespace dep_planner {

namespace {

Result<NodeId> to_node_id(int64_t raw, std::string_view field) {
    if (raw < 0 || raw > static_cast<int64_t>(std::numeric_limits<NodeId>::max() - 1)) {
        return Error{ErrorCode::OutOfRange,
                     std::string{field} + " = " + std::to_string(raw) + " is not a valid node id"};
    }
    return static_cast<NodeId>(raw);
}

/// The name becomes part of output file names, so it must be a single plain component.
Result<void> check_name(const std::string& name) {
    bool plain = !name.empty() && name != "." && name != ".."
        && name.find_first_of("/\\") == std::string::npos
        && std::filesystem::path(name).filename() == name;
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20) plain = false;
    }
    if (!plain) {
        return Error{ErrorCode::InvalidInput,
                     "Graph name '" + name + "' is not a plain file name"};
    }
    return {};
}

Result<GraphDescriptor> from_table(const toml::table& tbl, std::string_view name_hint) {
    GraphDescriptor desc;
    desc.name = tbl["name"].value_or(std::string{name_hint});
    if (auto named = check_name(desc.name); !named) return named.error();
    desc.directed = tbl["directed"].value_or(true);
    desc.weight_model = tbl["weight_model"].value_or(std::string{"edge"});

    auto n = tbl["n"].value<int64_t>();
    if (!n) {
        return Error{ErrorCode::InvalidInput, "Graph '" + desc.name + "' has no integer 'n'"};
    }
    if (*n < 0) {
        return Error{ErrorCode::InvalidInput,
                     "Graph '" + desc.name + "' has negative node count " + std::to_string(*n)};
    }
    if (*n > static_cast<int64_t>(std::numeric_limits<NodeId>::max() - 1)) {
        return Error{ErrorCode::InvalidInput,
                     "Graph '" + desc.name + "' node count " + std::to_string(*n)
                     + " exceeds the node id range"};
    }
    desc.n = static_cast<size_t>(*n);

    if (auto source = tbl["source"].value<int64_t>()) {
        auto id = to_node_id(*source, "source");
        if (!id) return id.error();
        desc.source = *id;
    }

    if (auto edges_node = tbl["edges"]; edges_node) {
        const auto* edges = edges_node.as_array();
        if (edges == nullptr) {
            return Error{ErrorCode::InvalidInput, "'edges' must be an array of tables"};
        }
        desc.edges.reserve(edges->size());

        size_t index = 0;
        for (const auto& entry : *edges) {
            const auto* edge = entry.as_table();
            if (edge == nullptr) {
                return Error{ErrorCode::InvalidInput,
                             "edges[" + std::to_string(index) + "] is not a table"};
            }
            auto u = (*edge)["u"].value<int64_t>();
            auto v = (*edge)["v"].value<int64_t>();
            auto w = (*edge)["w"].value<int64_t>();
            if (!u || !v) {
                return Error{ErrorCode::InvalidInput,
                             "edges[" + std::to_string(index) + "] needs integer 'u' and 'v'"};
            }
            int64_t weight = w.value_or(1);
            if (weight < std::numeric_limits<Weight>::min()
                || weight > std::numeric_limits<Weight>::max()) {
                return Error{ErrorCode::InvalidInput,
                             "edges[" + std::to_string(index) + "] weight "
                             + std::to_string(weight) + " does not fit in 32 bits"};
            }

            auto from = to_node_id(*u, "u");
            if (!from) return from.error();
            auto to = to_node_id(*v, "v");
            if (!to) return to.error();

            desc.edges.push_back(EdgeDescriptor{*from, *to, static_cast<Weight>(weight)});
            ++index;
        }
    }

    return desc;
}

}  // namespace

Result<GraphDescriptor> parse_graph_descriptor(std::string_view toml_text,
                                               std::string_view name_hint) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl, name_hint);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<GraphDescriptor> load_graph_descriptor(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Graph file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl, path.stem().string());
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     path.string() + ": " + std::string{err.description()}};
    }
}

Result<Graph> build_graph(const GraphDescriptor& descriptor) {
    if (!descriptor.directed) {
        return Error{ErrorCode::InvalidInput,
                     "Graph '" + descriptor.name + "' is undirected; only directed graphs are supported"};
    }

    Graph graph(descriptor.n, true);
    for (const auto& edge : descriptor.edges) {
        if (auto added = graph.add_edge(edge.u, edge.v, edge.w); !added) {
            return added.error();
        }
    }

    if (descriptor.source && !graph.contains(*descriptor.source)) {
        return Error{ErrorCode::OutOfRange,
                     "Source node " + std::to_string(*descriptor.source)
                     + " is out of range [0, " + std::to_string(descriptor.n) + ")"};
    }

    return graph;
}

}  // namespace dep_planner
