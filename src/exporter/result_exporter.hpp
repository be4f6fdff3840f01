/**
 * @file result_exporter.hpp
 * @brief Writes execution plans to JSON and CSV files.
 * @author Dimitris Kafetzis
 *
 * Layout under the output directory:
 *   json/<name>_plan.json
 *   csv/<name>_components.csv
 *   csv/<name>_paths.csv
 *   csv/<name>_metrics.csv
 *   summary.csv
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "planner/execution_planner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dep_planner {

class ResultExporter {
public:
    explicit ResultExporter(std::filesystem::path output_dir);

    /// Creates the json/ and csv/ subdirectories.
    Result<void> prepare() const;

    /// Writes the JSON plan and the three per-graph CSV files.
    Result<void> export_plan(const ExecutionPlan& plan) const;

    /// One row per plan, with the header line.
    Result<void> export_summary(const std::vector<ExecutionPlan>& plans) const;

    [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

    // Renderers (exposed for tests)
    [[nodiscard]] static std::string plan_json(const ExecutionPlan& plan);
    [[nodiscard]] static std::string components_csv(const ExecutionPlan& plan);
    [[nodiscard]] static std::string paths_csv(const ExecutionPlan& plan);
    [[nodiscard]] static std::string metrics_csv(const ExecutionPlan& plan);
    [[nodiscard]] static std::string summary_csv(const std::vector<ExecutionPlan>& plans);

private:
    Result<void> write_file(const std::filesystem::path& path, const std::string& content) const;

    std::filesystem::path output_dir_;
};

}  // namespace dep_planner
