/**
 * @file main.cpp
 * @brief DepPlanner command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Runs the planning pipeline over every configured dataset:
 *   Config → Logger → Loader → Planner → Exporter → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "exporter/result_exporter.hpp"
#include "graph/graph_loader.hpp"
#include "graph/graph_stats.hpp"
#include "planner/execution_planner.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace dep_planner;

namespace {

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            DepPlanner v1.0.0              ║
  ║   SCC → Topological Order → Critical Path ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::vector<std::filesystem::path> graphs;
    std::optional<NodeId> source;
    std::string output_dir;
    std::string log_dir;
    bool no_export = false;
};

void print_usage() {
    std::cout << "Usage: dep_planner [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --graph <file>     Graph descriptor (TOML); may be repeated\n"
              << "  --source <id>      Source task id, overrides the descriptor\n"
              << "  --output <dir>     Result directory\n"
              << "  --log-dir <path>   Log output directory (default: stdout)\n"
              << "  --no-export        Skip JSON/CSV export\n"
              << "  --help, -h         Show this help message\n";
}

std::optional<NodeId> parse_node_id(std::string_view text) {
    NodeId value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--graph" && i + 1 < argc) {
            args.graphs.emplace_back(argv[++i]);
        } else if (arg == "--source" && i + 1 < argc) {
            args.source = parse_node_id(argv[++i]);
            if (!args.source) {
                std::cerr << "Invalid --source value: " << argv[i] << std::endl;
                std::exit(2);
            }
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_dir = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--no-export") {
            args.no_export = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::vector<std::filesystem::path> resolve_datasets(const CLIArgs& args, const Config& config) {
    if (!args.graphs.empty()) return args.graphs;

    std::vector<std::filesystem::path> datasets;
    for (const auto& name : config.input.graphs) {
        datasets.push_back(config.input.graph_dir / name);
    }
    return datasets;
}

/**
 * @brief Load, plan and export one dataset.
 */
Result<ExecutionPlan> process_dataset(const std::filesystem::path& path,
                                      const CLIArgs& args,
                                      const Config& config,
                                      ExecutionPlanner& planner,
                                      const ResultExporter* exporter,
                                      Logger& logger) {
    auto descriptor = load_graph_descriptor(path);
    if (!descriptor) return descriptor.error();

    auto graph = build_graph(*descriptor);
    if (!graph) return graph.error();

    auto stats = compute_stats(*graph);
    logger.info(descriptor->name + ": " + stats.to_string()
                + (has_self_loops(*graph) ? " (self-loops present)" : ""));

    NodeId source = args.source.value_or(
        descriptor->source.value_or(config.planner.default_source));

    auto plan = planner.plan(*graph, source, descriptor->name);
    if (!plan) return plan.error();

    if (exporter != nullptr) {
        if (auto exported = exporter->export_plan(*plan); !exported) {
            return exported.error();
        }
        logger.info(descriptor->name + ": results exported to "
                    + exporter->output_dir().string());
    }

    return plan;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.output_dir.empty()) config.exporter.output_dir = args.output_dir;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.no_export) config.exporter.enabled = false;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "dep_planner");
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level);
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    if (!level) {
        logger.warn("Unknown log level '" + config.telemetry.log_level + "', using info");
    }
    logger.info("DepPlanner starting...");
    logger.info("Critical path policy: "
                + std::string{to_string(config.planner.critical_path_policy)});

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.metrics_file.empty()) {
        auto dir = config.telemetry.metrics_file.parent_path();
        metrics_sink = std::make_unique<JsonFileSink>(dir.empty() ? std::filesystem::path{"."} : dir,
                                                      config.telemetry.metrics_file.stem().string());
    } else {
        metrics_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(metrics_sink));

    // ── Pipeline ─────────────────────────────
    ExecutionPlanner planner(config.planner, logger, metrics);

    std::optional<ResultExporter> exporter;
    if (config.exporter.enabled) {
        exporter.emplace(config.exporter.output_dir);
    }

    auto datasets = resolve_datasets(args, config);
    if (datasets.empty()) {
        logger.error("No graphs given; use --graph or [input].graphs in the config");
        logger.flush();
        return 2;
    }

    std::vector<ExecutionPlan> plans;
    size_t failures = 0;

    for (const auto& path : datasets) {
        logger.info("Processing " + path.string());
        auto plan = process_dataset(path, args, config, planner,
                                    exporter ? &*exporter : nullptr, logger);
        if (!plan) {
            ++failures;
            logger.error(path.string() + ": [" + std::string{to_string(plan.error().code)}
                         + "] " + plan.error().message);
            metrics.record_failure(path.stem().string(), plan.error().message);
            continue;
        }
        plans.push_back(std::move(*plan));
    }

    if (exporter && !plans.empty()) {
        if (auto summary = exporter->export_summary(plans); !summary) {
            ++failures;
            logger.error("Summary export failed: " + summary.error().message);
        }
    }

    logger.info("Processed " + std::to_string(datasets.size()) + " datasets, "
                + std::to_string(failures) + " failed");
    metrics.flush();
    logger.flush();
    return failures == 0 ? 0 : 1;
}
