// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "PotentialFlow/utils/Config.hpp"

using namespace pflow;

namespace
{
    nlohmann::json fullConfig()
    {
        return nlohmann::json::parse(R"({
            "free_stream_velocity": 2.5,
            "fluid_density": 1.225,
            "particle_count": 1200,
            "obstacle_type": "Airfoil",
            "obstacle_position": [1.0, -0.5, 0.25],
            "tunnel": {"entry_x": -12.0, "exit_x": 14.0, "width": 6.0, "height": 5.0},
            "evaluator_backend": "scalar",
            "max_primary_failures": 0,
            "validate_output": false,
            "random_seed": 7,
            "total_steps": 50,
            "output_frequency": 10,
            "log_level": "error",
            "slice": {"field": "pressure", "axis": "y", "position": 0.5, "resolution": 40, "refresh_interval": 15}
        })");
    }
} // namespace

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path() /
                ("potflow_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        // load() re-targets the logger at a file inside m_dir
        Logger::initConsole("error");
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::string writeFile(const std::string &name, const std::string &content)
    {
        const std::filesystem::path path = m_dir / name;
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path m_dir;
};

TEST_F(ConfigTest, EmptyObjectGivesDefaults)
{
    Config config;
    ASSERT_TRUE(config.loadFromJson(nlohmann::json::object()));
    const auto &params = config.getParams();
    EXPECT_DOUBLE_EQ(params.free_stream_velocity, 1.0);
    EXPECT_DOUBLE_EQ(params.fluid_density, 1.0);
    EXPECT_EQ(params.particle_count, 5000);
    EXPECT_EQ(params.obstacleKind(), ObstacleKind::Sphere);
    EXPECT_DOUBLE_EQ(params.tunnel.entry_x, -10.0);
    EXPECT_DOUBLE_EQ(params.tunnel.exit_x, 10.0);
    EXPECT_EQ(params.evaluatorBackend(), field::EvaluatorBackend::Auto);
    EXPECT_EQ(params.max_primary_failures, 3);
    EXPECT_TRUE(params.validate_output);
    EXPECT_EQ(params.random_seed, 42u);
    EXPECT_EQ(params.slice.resolution, 20);
    EXPECT_EQ(params.slice.refresh_interval, 30);
    EXPECT_FALSE(params.sliceSettings().active());
}

TEST_F(ConfigTest, ReadsEveryField)
{
    Config config;
    ASSERT_TRUE(config.loadFromJson(fullConfig()));
    const auto &params = config.getParams();

    EXPECT_DOUBLE_EQ(params.free_stream_velocity, 2.5);
    EXPECT_EQ(params.particle_count, 1200);
    EXPECT_DOUBLE_EQ(params.tunnel.width, 6.0);
    EXPECT_EQ(params.evaluatorBackend(), field::EvaluatorBackend::Scalar);
    EXPECT_EQ(params.max_primary_failures, 0);
    EXPECT_FALSE(params.validate_output);
    EXPECT_EQ(params.random_seed, 7u);

    const TickParameters tick = params.tickParameters();
    EXPECT_EQ(tick.obstacle.kind, ObstacleKind::Airfoil);
    EXPECT_EQ(tick.obstacle.position, vec3_t(1.0, -0.5, 0.25));
    EXPECT_DOUBLE_EQ(tick.flow.fluid_density, 1.225);

    const flow::SliceSettings slice = params.sliceSettings();
    EXPECT_EQ(slice.mode, flow::FieldMode::Pressure);
    EXPECT_EQ(slice.axis, flow::SliceAxis::Y);
    EXPECT_DOUBLE_EQ(slice.position, 0.5);
    EXPECT_EQ(slice.resolution, 40);
    EXPECT_EQ(slice.refresh_interval, 15);
}

TEST_F(ConfigTest, InvalidValuesFailValidation)
{
    const std::vector<std::pair<std::string, nlohmann::json>> broken = {
        {"tunnel", {{"entry_x", 5.0}, {"exit_x", 5.0}}},
        {"particle_count", 0},
        {"obstacle_type", "wing"},
        {"evaluator_backend", "gpu"},
        {"max_primary_failures", -1},
        {"output_frequency", 0},
    };
    for (const auto &entry : broken)
    {
        nlohmann::json j = nlohmann::json::object();
        j[entry.first] = entry.second;
        Config config;
        EXPECT_FALSE(config.loadFromJson(j)) << entry.first;
    }
}

TEST_F(ConfigTest, SliceSettingsAreValidated)
{
    Config config;
    EXPECT_FALSE(config.loadFromJson(nlohmann::json::parse(R"({"slice": {"resolution": 1}})")));
    EXPECT_FALSE(config.loadFromJson(nlohmann::json::parse(R"({"slice": {"axis": "w"}})")));
    EXPECT_FALSE(config.loadFromJson(nlohmann::json::parse(R"({"slice": {"refresh_interval": 0}})")));
    // outside the usual range is only a warning
    EXPECT_TRUE(config.loadFromJson(nlohmann::json::parse(R"({"slice": {"resolution": 400}})")));
}

TEST_F(ConfigTest, WrongTypeIsReported)
{
    Config config;
    EXPECT_FALSE(config.loadFromJson(nlohmann::json::parse(R"({"particle_count": "many"})")));
}

TEST_F(ConfigTest, LoadsFromFileAndOpensTheLog)
{
    nlohmann::json j = fullConfig();
    j["output_path"] = (m_dir / "out").string();
    j["log_file"] = "run.log";
    const std::string path = writeFile("wind_tunnel.json", j.dump());

    Config config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getParams().particle_count, 1200);
    EXPECT_TRUE(std::filesystem::exists(m_dir / "out" / "run.log"));
}

TEST_F(ConfigTest, MissingFileFails)
{
    Config config;
    EXPECT_FALSE(config.load((m_dir / "does_not_exist.json").string()));
}

TEST_F(ConfigTest, MalformedJsonFails)
{
    const std::string path = writeFile("broken.json", "{\"particle_count\": 10,");
    Config config;
    EXPECT_FALSE(config.load(path));
}
