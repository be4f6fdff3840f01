/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace dep_planner;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "dp_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.planner.default_source, 0u);
    EXPECT_EQ(config.planner.critical_path_policy, CriticalPathPolicy::EmptyPath);
    EXPECT_EQ(config.input.graph_dir.string(), "data");
    EXPECT_TRUE(config.input.graphs.empty());
    EXPECT_TRUE(config.exporter.enabled);
    EXPECT_EQ(config.exporter.output_dir.string(), "results");
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_TRUE(config.telemetry.log_dir.empty());
    EXPECT_TRUE(config.telemetry.metrics_file.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [planner]
        default_source = 3
        critical_path_policy = "source"

        [input]
        graph_dir = "graphs"
        graphs = ["a.toml", "b.toml"]

        [export]
        enabled = false
        output_dir = "/tmp/dp_out"

        [telemetry]
        log_dir = "/tmp/dp_logs"
        log_level = "debug"
        metrics_file = "/tmp/dp_logs/metrics.ndjson"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.planner.default_source, 3u);
    EXPECT_EQ(config.planner.critical_path_policy, CriticalPathPolicy::SourceOnly);
    EXPECT_EQ(config.input.graph_dir.string(), "graphs");
    ASSERT_EQ(config.input.graphs.size(), 2u);
    EXPECT_EQ(config.input.graphs[1], "b.toml");
    EXPECT_FALSE(config.exporter.enabled);
    EXPECT_EQ(config.exporter.output_dir.string(), "/tmp/dp_out");
    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/dp_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.metrics_file.filename().string(), "metrics.ndjson");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [planner]
        default_source = 7
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->planner.default_source, 7u);
    // Defaults for everything else
    EXPECT_EQ(result->planner.critical_path_policy, CriticalPathPolicy::EmptyPath);
    EXPECT_TRUE(result->exporter.enabled);
    EXPECT_EQ(result->telemetry.log_level, "info");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, UnknownPolicyRejected) {
    auto path = write_toml(R"(
        [planner]
        critical_path_policy = "longest"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, NegativeSourceRejected) {
    auto path = write_toml(R"(
        [planner]
        default_source = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, OversizedSourceRejected) {
    auto path = write_toml(R"(
        [planner]
        default_source = 5000000000
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}
