/**
 * @file graph.cpp
 * @brief Graph implementation.
 * @author Dimitris Kafetzis
 */

#include "graph/graph.hpp"

#include <sstream>

namespace dep_planner {

Graph::Graph(size_t node_count, bool directed)
    : adjacency_(node_count), directed_(directed) {}

Result<void> Graph::add_edge(NodeId u, NodeId v, Weight w) {
    for (NodeId endpoint : {u, v}) {
        if (!contains(endpoint)) {
            return Error{ErrorCode::OutOfRange,
                         "Node " + std::to_string(endpoint) + " is out of range [0, "
                         + std::to_string(adjacency_.size()) + ")"};
        }
    }
    adjacency_[u].push_back(Edge{v, w});
    ++edge_count_;
    return {};
}

std::span<const Edge> Graph::neighbors(NodeId node) const {
    if (!contains(node)) return {};
    return adjacency_[node];
}

Graph Graph::transposed() const {
    Graph reversed(adjacency_.size(), directed_);
    for (NodeId u = 0; u < adjacency_.size(); ++u) {
        for (const auto& edge : adjacency_[u]) {
            reversed.adjacency_[edge.target].push_back(Edge{u, edge.weight});
        }
    }
    reversed.edge_count_ = edge_count_;
    return reversed;
}

std::string Graph::to_string() const {
    std::ostringstream oss;
    oss << "Graph(n=" << adjacency_.size()
        << ", directed=" << (directed_ ? "true" : "false") << ")\n";
    for (size_t u = 0; u < adjacency_.size(); ++u) {
        oss << u << ":";
        for (const auto& edge : adjacency_[u]) {
            oss << " ->" << edge.target << "(" << edge.weight << ")";
        }
        oss << '\n';
    }
    return oss.str();
}

}  // namespace dep_planner
