/**
 * @file config.hpp
 * @brief Planner configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace dep_planner {

struct PlannerConfig {
    NodeId default_source = 0;          ///< Used when a descriptor names no source
    CriticalPathPolicy critical_path_policy = CriticalPathPolicy::EmptyPath;
};

struct InputConfig {
    std::filesystem::path graph_dir = "data";
    std::vector<std::string> graphs;    ///< Files relative to graph_dir
};

struct ExportConfig {
    bool enabled = true;
    std::filesystem::path output_dir = "results";
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = stdout
    std::string log_level = "info";
    std::filesystem::path metrics_file; ///< Empty = metrics events discarded
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    PlannerConfig planner;
    InputConfig input;
    ExportConfig exporter;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace dep_planner
