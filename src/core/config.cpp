/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <string>

namespace dep_planner {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [planner]
        if (auto planner = tbl["planner"]; planner.is_table()) {
            auto source = planner["default_source"].value_or(int64_t{0});
            if (source < 0) {
                return Error{ErrorCode::InvalidInput,
                             "planner.default_source must be non-negative"};
            }
            if (source > static_cast<int64_t>(std::numeric_limits<NodeId>::max() - 1)) {
                return Error{ErrorCode::InvalidInput,
                             "planner.default_source " + std::to_string(source)
                             + " is not a valid node id"};
            }
            config.planner.default_source = static_cast<NodeId>(source);

            auto policy = planner["critical_path_policy"].value_or(std::string{"empty"});
            if (policy == "empty") {
                config.planner.critical_path_policy = CriticalPathPolicy::EmptyPath;
            } else if (policy == "source") {
                config.planner.critical_path_policy = CriticalPathPolicy::SourceOnly;
            } else {
                return Error{ErrorCode::InvalidInput,
                             "Unknown planner.critical_path_policy: " + policy};
            }
        }

        // [input]
        if (auto input = tbl["input"]; input.is_table()) {
            config.input.graph_dir = input["graph_dir"].value_or(std::string{"data"});
            if (auto* graphs = input["graphs"].as_array()) {
                for (const auto& entry : *graphs) {
                    if (auto name = entry.value<std::string>()) {
                        config.input.graphs.push_back(*name);
                    }
                }
            }
        }

        // [export]
        if (auto exporter = tbl["export"]; exporter.is_table()) {
            config.exporter.enabled = exporter["enabled"].value_or(true);
            config.exporter.output_dir = exporter["output_dir"].value_or(std::string{"results"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_file = telemetry["metrics_file"].value_or(std::string{});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace dep_planner
