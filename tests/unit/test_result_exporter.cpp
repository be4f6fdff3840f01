/**
 * @file test_result_exporter.cpp
 * @brief Unit tests for JSON/CSV rendering and file export.
 * @author Dimitris Kafetzis
 */

#include "exporter/result_exporter.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace dep_planner;

namespace {

/// Source component 0, one cyclic component {1,2}, component 2 unreachable.
ExecutionPlan make_plan() {
    ExecutionPlan plan;
    plan.graph_name = "demo";
    plan.node_count = 4;
    plan.edge_count = 3;
    plan.source = 0;
    plan.source_component = 0;
    plan.components = {{0}, {1, 2}, {3}};
    plan.component_of = {0, 1, 1, 2};
    plan.component_order = {0, 1, 2};
    plan.task_order = {0, 1, 2, 3};
    plan.shortest = {Distance::of(0), Distance::of(4), Distance::unreachable()};
    plan.longest = {Distance::of(0), Distance::of(6), Distance::unreachable()};
    plan.critical_path.length = 6;
    plan.critical_path.nodes = {0, 1};
    plan.critical_tasks = {0, 1, 2};

    plan.metrics.scc.dfs_visits = 8;
    plan.metrics.scc.edge_traversals = 6;
    plan.metrics.topo.queue_pushes = 3;
    plan.metrics.topo.queue_pops = 3;
    plan.metrics.shortest_paths.relax_operations = 2;
    plan.metrics.longest_paths.relax_operations = 2;
    return plan;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

}  // namespace

// ─── Renderers ───────────────────────────────

TEST(ResultExporterTest, ComponentsCsv) {
    EXPECT_EQ(ResultExporter::components_csv(make_plan()),
              "component_id,size,node_list,is_cycle\n"
              "0,1,\"0\",false\n"
              "1,2,\"1 2\",true\n"
              "2,1,\"3\",false\n");
}

TEST(ResultExporterTest, PathsCsv) {
    EXPECT_EQ(ResultExporter::paths_csv(make_plan()),
              "component_id,shortest_distance,longest_distance,reachable,is_source_component\n"
              "0,0,0,true,true\n"
              "1,4,6,true,false\n"
              "2,UNREACHABLE,UNREACHABLE,false,false\n");
}

TEST(ResultExporterTest, MetricsCsv) {
    EXPECT_EQ(ResultExporter::metrics_csv(make_plan()),
              "algorithm,time_ms,operations,components,source,has_cycles,critical_path_length\n"
              "SCC,0.000,14,3,0,true,6\n"
              "TopologicalSort,0.000,6,3,0,true,6\n"
              "PathFinding,0.000,4,3,0,true,6\n"
              "TOTAL,0.000,24,3,0,true,6\n");
}

TEST(ResultExporterTest, SummaryCsv) {
    auto first = make_plan();
    auto second = make_plan();
    second.graph_name = "other";
    second.components = {{0}, {1}, {2}, {3}};
    second.critical_path.length = 2;

    EXPECT_EQ(ResultExporter::summary_csv({first, second}),
              "graph,nodes,edges,components,source,scc_time_ms,topo_time_ms,path_time_ms,"
              "total_time_ms,critical_path_length,has_cycles\n"
              "demo,4,3,3,0,0.000,0.000,0.000,0.000,6,true\n"
              "other,4,3,4,0,0.000,0.000,0.000,0.000,2,false\n");
}

TEST(ResultExporterTest, SummaryCsvQuotesNamesWithSeparators) {
    auto plan = make_plan();
    plan.graph_name = "a,b";
    auto csv = ResultExporter::summary_csv({plan});
    EXPECT_NE(csv.find("\n\"a,b\",4,3,3,"), std::string::npos) << csv;

    plan.graph_name = "say \"hi\"";
    csv = ResultExporter::summary_csv({plan});
    EXPECT_NE(csv.find("\n\"say \"\"hi\"\"\",4,"), std::string::npos) << csv;
}

TEST(ResultExporterTest, PlanJson) {
    auto json = ResultExporter::plan_json(make_plan());

    EXPECT_NE(json.find(R"("graph": "demo")"), std::string::npos);
    EXPECT_NE(json.find(R"("has_cycles": true)"), std::string::npos);
    EXPECT_NE(json.find(R"({"id": 1, "size": 2, "nodes": [1, 2]})"), std::string::npos);
    EXPECT_NE(json.find(R"("component_order": [0, 1, 2])"), std::string::npos);
    EXPECT_NE(json.find(R"("shortest_distances": [0, 4, "UNREACHABLE"])"), std::string::npos);
    EXPECT_NE(json.find(R"("longest_distances": [0, 6, "UNREACHABLE"])"), std::string::npos);
    EXPECT_NE(json.find(R"("critical_path": {"length": 6, "components": [0, 1], "tasks": [0, 1, 2]})"),
              std::string::npos);
    EXPECT_NE(json.find(R"("relax_operations": 4)"), std::string::npos);
}

TEST(ResultExporterTest, PlanJsonForEmptyPlan) {
    ExecutionPlan plan;
    plan.graph_name = "empty";
    auto json = ResultExporter::plan_json(plan);
    EXPECT_NE(json.find(R"("components": [],)"), std::string::npos);
    EXPECT_NE(json.find(R"("has_cycles": false)"), std::string::npos);
}

// ─── File Export ─────────────────────────────

class ResultExporterFileTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "dp_test_exporter";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(ResultExporterFileTest, ExportPlanWritesAllFiles) {
    ResultExporter exporter(temp_dir_);
    auto plan = make_plan();
    auto exported = exporter.export_plan(plan);
    ASSERT_TRUE(exported.has_value()) << exported.error().message;

    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "json" / "demo_plan.json"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "csv" / "demo_components.csv"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "csv" / "demo_paths.csv"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "csv" / "demo_metrics.csv"));
    EXPECT_EQ(read_file(temp_dir_ / "csv" / "demo_paths.csv"), ResultExporter::paths_csv(plan));
}

TEST_F(ResultExporterFileTest, ExportSummary) {
    ResultExporter exporter(temp_dir_);
    std::vector<ExecutionPlan> plans{make_plan()};
    ASSERT_TRUE(exporter.export_summary(plans).has_value());
    EXPECT_EQ(read_file(temp_dir_ / "summary.csv"), ResultExporter::summary_csv(plans));
}

TEST_F(ResultExporterFileTest, UnwritableDirectoryIsIoError) {
    std::filesystem::create_directories(temp_dir_);
    auto blocker = temp_dir_ / "blocked";
    { std::ofstream ofs(blocker); ofs << "not a directory"; }

    ResultExporter exporter(blocker);
    auto exported = exporter.export_plan(make_plan());
    ASSERT_FALSE(exported.has_value());
    EXPECT_EQ(exported.error().code, ErrorCode::Io);
}

TEST_F(ResultExporterFileTest, NameWithPathSeparatorsIsRejected) {
    ResultExporter exporter(temp_dir_);
    auto plan = make_plan();
    for (const char* name : {"../../escaped", "a/b", "..", ""}) {
        plan.graph_name = name;
        auto exported = exporter.export_plan(plan);
        ASSERT_FALSE(exported.has_value()) << name;
        EXPECT_EQ(exported.error().code, ErrorCode::InvalidInput) << name;
    }
    EXPECT_FALSE(std::filesystem::exists(temp_dir_.parent_path() / "escaped_plan.json"));
}
