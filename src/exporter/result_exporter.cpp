/**
 * @file result_exporter.cpp
 * @brief JSON/CSV rendering of execution plans.
 * @author Dimitris Kafetzis
 */

#include "exporter/result_exporter.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace dep_planner {

namespace {

constexpr std::string_view kUnreachable = "UNREACHABLE";

template <typename T>
void write_list(std::ostream& os, const std::vector<T>& values, std::string_view sep = ",") {
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) os << sep;
        os << values[i];
    }
}

void write_distance_json(std::ostream& os, const Distance& d) {
    if (d.reachable()) {
        os << d.value();
    } else {
        os << '"' << kUnreachable << '"';
    }
}

std::string distance_text(const Distance& d) {
    return d.reachable() ? std::to_string(d.value()) : std::string{kUnreachable};
}

/// RFC 4180 quoting, applied only when the field needs it.
std::string csv_field(std::string_view text) {
    if (text.find_first_of(",\"\r\n") == std::string_view::npos) return std::string{text};
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_ms(std::ostream& os, Duration elapsed) {
    os << std::fixed << std::setprecision(3)
       << std::chrono::duration<double, std::milli>(elapsed).count();
    os.unsetf(std::ios::floatfield);
}

}  // namespace

ResultExporter::ResultExporter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

Result<void> ResultExporter::prepare() const {
    std::error_code ec;
    for (const char* sub : {"json", "csv"}) {
        std::filesystem::create_directories(output_dir_ / sub, ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create " + (output_dir_ / sub).string()
                                        + ": " + ec.message()};
        }
    }
    return {};
}

Result<void> ResultExporter::write_file(const std::filesystem::path& path,
                                        const std::string& content) const {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        return Error{ErrorCode::Io, "Cannot open " + path.string() + " for writing"};
    }
    ofs << content;
    ofs.flush();
    if (!ofs) {
        return Error{ErrorCode::Io, "Write failed for " + path.string()};
    }
    return {};
}

Result<void> ResultExporter::export_plan(const ExecutionPlan& plan) const {
    if (auto ready = prepare(); !ready) return ready;

    const auto& name = plan.graph_name;
    if (name.empty() || name == "." || name == ".."
        || name.find_first_of("/\\") != std::string::npos) {
        return Error{ErrorCode::InvalidInput,
                     "Graph name '" + name + "' cannot be used as a file name"};
    }
    const std::pair<std::filesystem::path, std::string> files[] = {
        {output_dir_ / "json" / (name + "_plan.json"), plan_json(plan)},
        {output_dir_ / "csv" / (name + "_components.csv"), components_csv(plan)},
        {output_dir_ / "csv" / (name + "_paths.csv"), paths_csv(plan)},
        {output_dir_ / "csv" / (name + "_metrics.csv"), metrics_csv(plan)},
    };

    for (const auto& [path, content] : files) {
        if (auto written = write_file(path, content); !written) return written;
    }
    return {};
}

Result<void> ResultExporter::export_summary(const std::vector<ExecutionPlan>& plans) const {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create " + output_dir_.string() + ": " + ec.message()};
    }
    return write_file(output_dir_ / "summary.csv", summary_csv(plans));
}

// ─────────────────────────────────────────────
// Renderers
// ─────────────────────────────────────────────

std::string ResultExporter::plan_json(const ExecutionPlan& plan) {
    std::ostringstream oss;
    oss << "{\n"
        << R"(  "graph": ")" << json_escape(plan.graph_name) << "\",\n"
        << R"(  "node_count": )" << plan.node_count << ",\n"
        << R"(  "edge_count": )" << plan.edge_count << ",\n"
        << R"(  "source": )" << plan.source << ",\n"
        << R"(  "source_component": )" << plan.source_component << ",\n"
        << R"(  "has_cycles": )" << (plan.has_cycles() ? "true" : "false") << ",\n";

    oss << R"(  "components": [)";
    for (size_t i = 0; i < plan.components.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\n    {\"id\": " << i
            << ", \"size\": " << plan.components[i].size()
            << ", \"nodes\": [";
        write_list(oss, plan.components[i], ", ");
        oss << "]}";
    }
    oss << (plan.components.empty() ? "],\n" : "\n  ],\n");

    oss << R"(  "component_order": [)";
    write_list(oss, plan.component_order, ", ");
    oss << "],\n";

    oss << R"(  "task_order": [)";
    write_list(oss, plan.task_order, ", ");
    oss << "],\n";

    oss << R"(  "shortest_distances": [)";
    for (size_t i = 0; i < plan.shortest.size(); ++i) {
        if (i > 0) oss << ", ";
        write_distance_json(oss, plan.shortest[i]);
    }
    oss << "],\n";

    oss << R"(  "longest_distances": [)";
    for (size_t i = 0; i < plan.longest.size(); ++i) {
        if (i > 0) oss << ", ";
        write_distance_json(oss, plan.longest[i]);
    }
    oss << "],\n";

    oss << R"(  "critical_path": {"length": )" << plan.critical_path.length
        << R"(, "components": [)";
    write_list(oss, plan.critical_path.nodes, ", ");
    oss << R"(], "tasks": [)";
    write_list(oss, plan.critical_tasks, ", ");
    oss << "]},\n";

    const auto& m = plan.metrics;
    oss << R"(  "metrics": {)"
        << "\"scc_count\": " << plan.components.size()
        << ", \"dfs_visits\": " << m.scc.dfs_visits
        << ", \"edge_traversals\": " << m.scc.edge_traversals
        << ", \"queue_pushes\": " << m.topo.queue_pushes
        << ", \"queue_pops\": " << m.topo.queue_pops
        << ", \"relax_operations\": "
        << (m.shortest_paths.relax_operations + m.longest_paths.relax_operations)
        << ", \"scc_time_ms\": ";
    write_ms(oss, m.scc.elapsed);
    oss << ", \"topo_time_ms\": ";
    write_ms(oss, m.topo.elapsed);
    oss << ", \"shortest_paths_time_ms\": ";
    write_ms(oss, m.shortest_paths.elapsed);
    oss << ", \"longest_paths_time_ms\": ";
    write_ms(oss, m.longest_paths.elapsed);
    oss << ", \"total_time_ms\": ";
    write_ms(oss, m.total_elapsed());
    oss << "}\n}\n";

    return oss.str();
}

std::string ResultExporter::components_csv(const ExecutionPlan& plan) {
    std::ostringstream oss;
    oss << "component_id,size,node_list,is_cycle\n";
    for (size_t i = 0; i < plan.components.size(); ++i) {
        const auto& component = plan.components[i];
        oss << i << ',' << component.size() << ",\"";
        write_list(oss, component, " ");
        oss << "\"," << (component.size() > 1 ? "true" : "false") << '\n';
    }
    return oss.str();
}

std::string ResultExporter::paths_csv(const ExecutionPlan& plan) {
    std::ostringstream oss;
    oss << "component_id,shortest_distance,longest_distance,reachable,is_source_component\n";
    for (size_t i = 0; i < plan.shortest.size(); ++i) {
        const Distance& s = plan.shortest[i];
        Distance l = i < plan.longest.size() ? plan.longest[i] : Distance::unreachable();
        oss << i << ','
            << distance_text(s) << ','
            << distance_text(l) << ','
            << (s.reachable() ? "true" : "false") << ','
            << (i == plan.source_component ? "true" : "false") << '\n';
    }
    return oss.str();
}

std::string ResultExporter::metrics_csv(const ExecutionPlan& plan) {
    const auto& m = plan.metrics;
    const size_t components = plan.components.size();
    const bool cycles = plan.has_cycles();

    auto row = [&](std::ostream& os, std::string_view algorithm, Duration elapsed,
                   uint64_t operations) {
        os << algorithm << ',';
        write_ms(os, elapsed);
        os << ',' << operations << ',' << components << ',' << plan.source << ','
           << (cycles ? "true" : "false") << ',' << plan.critical_path.length << '\n';
    };

    uint64_t scc_ops = m.scc.dfs_visits + m.scc.edge_traversals;
    uint64_t topo_ops = m.topo.queue_pushes + m.topo.queue_pops;
    uint64_t path_ops = m.shortest_paths.relax_operations + m.longest_paths.relax_operations;

    std::ostringstream oss;
    oss << "algorithm,time_ms,operations,components,source,has_cycles,critical_path_length\n";
    row(oss, "SCC", m.scc.elapsed, scc_ops);
    row(oss, "TopologicalSort", m.topo.elapsed, topo_ops);
    row(oss, "PathFinding", m.shortest_paths.elapsed + m.longest_paths.elapsed, path_ops);
    row(oss, "TOTAL", m.total_elapsed(), scc_ops + topo_ops + path_ops);
    return oss.str();
}

std::string ResultExporter::summary_csv(const std::vector<ExecutionPlan>& plans) {
    std::ostringstream oss;
    oss << "graph,nodes,edges,components,source,scc_time_ms,topo_time_ms,path_time_ms,"
           "total_time_ms,critical_path_length,has_cycles\n";
    for (const auto& plan : plans) {
        const auto& m = plan.metrics;
        oss << csv_field(plan.graph_name) << ',' << plan.node_count << ',' << plan.edge_count << ','
            << plan.components.size() << ',' << plan.source << ',';
        write_ms(oss, m.scc.elapsed);
        oss << ',';
        write_ms(oss, m.topo.elapsed);
        oss << ',';
        write_ms(oss, m.shortest_paths.elapsed + m.longest_paths.elapsed);
        oss << ',';
        write_ms(oss, m.total_elapsed());
        oss << ',' << plan.critical_path.length << ','
            << (plan.has_cycles() ? "true" : "false") << '\n';
    }
    return oss.str();
}

}  // namespace dep_planner
