/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace dep_planner {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_run(std::string_view graph, std::string_view stage,
                                  const RunMetrics& metrics) {
    std::ostringstream oss;
    oss << R"({"event":"algorithm_run")"
        << R"(,"graph":")" << json_escape(graph) << "\""
        << R"(,"stage":")" << json_escape(stage) << "\""
        << R"(,"elapsed_ns":)" << metrics.elapsed.count()
        << R"(,"dfs_visits":)" << metrics.dfs_visits
        << R"(,"edge_traversals":)" << metrics.edge_traversals
        << R"(,"queue_pushes":)" << metrics.queue_pushes
        << R"(,"queue_pops":)" << metrics.queue_pops
        << R"(,"relax_operations":)" << metrics.relax_operations
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_graph(std::string_view graph, size_t nodes, size_t edges,
                                    size_t components, size_t cyclic_components) {
    std::ostringstream oss;
    oss << R"({"event":"graph_loaded")"
        << R"(,"graph":")" << json_escape(graph) << "\""
        << R"(,"nodes":)" << nodes
        << R"(,"edges":)" << edges
        << R"(,"components":)" << components
        << R"(,"cyclic_components":)" << cyclic_components
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_failure(std::string_view graph, std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"graph_failed")"
        << R"(,"graph":")" << json_escape(graph) << "\""
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace dep_planner
