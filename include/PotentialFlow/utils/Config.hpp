// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <array>
#include <string>
#include <nlohmann/json.hpp>

#include "PotentialFlow/utils/Logger.hpp"

#include "PotentialFlow/field/EvaluatorSelection.hpp"
#include "PotentialFlow/field/FlowTypes.hpp"
#include "PotentialFlow/flow/FieldSlice.hpp"
#include "PotentialFlow/flow/Tunnel.hpp"

namespace pflow
{
    struct SliceConfig
    {
        std::string field = "none"; // "none", "velocity" or "pressure"
        std::string axis = "none";  // "none", "x", "y" or "z"
        double position = 0.0;
        int resolution = 20;
        int refresh_interval = 30; // ticks between rebuilds while the flow is unchanged
    };

    inline void from_json(const nlohmann::json &j, SliceConfig &slice)
    {
        slice.field = j.value("field", slice.field);
        slice.axis = j.value("axis", slice.axis);
        slice.position = j.value("position", slice.position);
        slice.resolution = j.value("resolution", slice.resolution);
        slice.refresh_interval = j.value("refresh_interval", slice.refresh_interval);
    }

    struct SimulationParameters
    {
        // flow
        double free_stream_velocity = 1.0;
        double fluid_density = 1.0;

        // scene
        int particle_count = 5000;
        std::string obstacle_type = "sphere";
        std::array<double, 3> obstacle_position = {0.0, 0.0, 0.0};
        flow::Tunnel tunnel;

        // evaluator strategy
        std::string evaluator_backend = "auto"; // "auto", "batch" or "scalar"
        int max_primary_failures = 3;           // 0 keeps retrying the primary forever
        bool validate_output = true;

        // simulation control
        unsigned int random_seed = 42;
        int total_steps = 1000;
        int output_frequency = 100;
        std::string output_path = "./output";

        std::string log_level = "info";
        std::string log_file = "potential_flow.log";

        SliceConfig slice;

        // typed views, valid after Config::load succeeded
        ObstacleKind obstacleKind() const { return obstacleKindFromName(obstacle_type); }
        field::EvaluatorBackend evaluatorBackend() const { return field::evaluatorBackendFromName(evaluator_backend); }
        flow::SliceSettings sliceSettings() const;
        TickParameters tickParameters() const;
    };

    inline void from_json(const nlohmann::json &j, SimulationParameters &params)
    {
        params.free_stream_velocity = j.value("free_stream_velocity", params.free_stream_velocity);
        params.fluid_density = j.value("fluid_density", params.fluid_density);
        params.particle_count = j.value("particle_count", params.particle_count);
        params.obstacle_type = j.value("obstacle_type", params.obstacle_type);
        params.obstacle_position = j.value("obstacle_position", params.obstacle_position);
        params.tunnel = j.value("tunnel", params.tunnel);
        params.evaluator_backend = j.value("evaluator_backend", params.evaluator_backend);
        params.max_primary_failures = j.value("max_primary_failures", params.max_primary_failures);
        params.validate_output = j.value("validate_output", params.validate_output);
        params.random_seed = j.value("random_seed", params.random_seed);
        params.total_steps = j.value("total_steps", params.total_steps);
        params.output_frequency = j.value("output_frequency", params.output_frequency);
        params.output_path = j.value("output_path", params.output_path);
        params.log_level = j.value("log_level", params.log_level);
        params.log_file = j.value("log_file", params.log_file);

        if (j.contains("slice") && j.at("slice").is_object())
        {
            j.at("slice").get_to(params.slice);
        }
    }

    class ConfigBase
    {
    public:
        bool loadBase(const std::string &filepath, nlohmann::json &data);
    };

    class Config : public ConfigBase
    {
    public:
        bool load(const std::string &filepath);

        // for hosts that build the configuration in memory; same validation as load()
        bool loadFromJson(const nlohmann::json &data);

        const SimulationParameters &getParams() const { return m_params; }

    private:
        bool postProcess();
        SimulationParameters m_params;
    };

} // namespace pflow
