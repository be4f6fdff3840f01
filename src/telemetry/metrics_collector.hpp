/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for algorithm runs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace dep_planner {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * One event per algorithm invocation; the counters come from the RunMetrics
 * value that invocation returned.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_run(std::string_view graph, std::string_view stage, const RunMetrics& metrics);
    void record_graph(std::string_view graph, size_t nodes, size_t edges, size_t components,
                      size_t cyclic_components);
    void record_failure(std::string_view graph, std::string_view reason);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace dep_planner
