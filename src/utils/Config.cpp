// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/utils/Config.hpp"
#include <fstream>
#include <filesystem>
#include <iostream>

namespace pflow {

flow::SliceSettings SimulationParameters::sliceSettings() const {
    flow::SliceSettings settings;
    settings.mode = flow::fieldModeFromName(slice.field);
    settings.axis = flow::sliceAxisFromName(slice.axis);
    settings.position = slice.position;
    settings.resolution = slice.resolution;
    settings.refresh_interval = slice.refresh_interval;
    return settings;
}

TickParameters SimulationParameters::tickParameters() const {
    TickParameters tick;
    tick.flow.free_stream_velocity = free_stream_velocity;
    tick.flow.fluid_density = fluid_density;
    tick.obstacle.kind = obstacleKind();
    tick.obstacle.position = vec3_t(obstacle_position[0], obstacle_position[1], obstacle_position[2]);
    return tick;
}

bool ConfigBase::loadBase(const std::string& filepath, nlohmann::json& data) {
    // the logger is not configured yet, report on stderr
    if (!std::filesystem::exists(filepath)) {
        std::cerr << "[Config FATAL] Configuration file not found at path: '" << filepath << "'" << std::endl;
        return false;
    }

    std::ifstream f(filepath);
    if (!f.is_open()) {
        std::cerr << "[Config FATAL] Could not open configuration file: '" << filepath << "'. Check permissions." << std::endl;
        return false;
    }

    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Config FATAL] JSON parsing failed in file '" << filepath << "':\n    - Error: " << e.what() << std::endl;
        return false;
    }

    std::string log_level = data.value("log_level", "info");
    std::string output_path = data.value("output_path", "./output");
    std::string log_file = data.value("log_file", "potential_flow.log");

    std::error_code ec;
    std::filesystem::create_directories(output_path, ec);
    if (ec) {
        std::cerr << "[Config FATAL] Could not create output directory '" << output_path << "': " << ec.message() << std::endl;
        return false;
    }
    std::string log_file_path = (std::filesystem::path(output_path) / log_file).string();

    Logger::init(log_level, log_file_path);

    LOG_INFO("Logger initialized. Log level: '{}', Log file: '{}'", log_level, log_file_path);
    LOG_INFO("Loading configuration from: '{}'", filepath);

    return true;
}

bool Config::load(const std::string& filepath) {
    nlohmann::json data;
    if (!loadBase(filepath, data)) {
        return false;
    }
    return loadFromJson(data);
}

bool Config::loadFromJson(const nlohmann::json& data) {
    try {
        m_params = data.get<SimulationParameters>();
        LOG_INFO("Simulation parameters parsed successfully.");
    } catch (const nlohmann::json::exception& e) {
        LOG_CRITICAL("JSON validation failed for simulation parameters:\n    - Error: {}", e.what());
        return false;
    }

    return postProcess();
}

bool Config::postProcess() {
    LOG_INFO("Post-processing configuration...");
    bool ok = true;

    if (!m_params.tunnel.isValid()) {
        LOG_ERROR("Invalid tunnel: entry_x ({}) must be below exit_x ({}) and width/height ({} x {}) positive.",
                  m_params.tunnel.entry_x, m_params.tunnel.exit_x, m_params.tunnel.width, m_params.tunnel.height);
        ok = false;
    }
    if (m_params.particle_count <= 0) {
        LOG_ERROR("`particle_count` must be positive, got {}.", m_params.particle_count);
        ok = false;
    }
    if (m_params.output_frequency <= 0) {
        LOG_ERROR("`output_frequency` must be positive, got {}.", m_params.output_frequency);
        ok = false;
    }
    if (m_params.max_primary_failures < 0) {
        LOG_ERROR("`max_primary_failures` must not be negative, got {}.", m_params.max_primary_failures);
        ok = false;
    }

    // names are checked here so that the typed views never throw later
    try {
        LOG_INFO("Obstacle: {} at [{}, {}, {}].", m_params.obstacleKind(),
                 m_params.obstacle_position[0], m_params.obstacle_position[1], m_params.obstacle_position[2]);
        LOG_INFO("Evaluator backend: '{}'.", field::evaluatorBackendName(m_params.evaluatorBackend()));
        m_params.sliceSettings();
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        ok = false;
    }

    if (m_params.slice.resolution < 2) {
        LOG_ERROR("Slice resolution must be at least 2, got {}.", m_params.slice.resolution);
        ok = false;
    } else if (m_params.slice.resolution < 10 || m_params.slice.resolution > 300) {
        LOG_WARN("Slice resolution {} is outside the usual range 10-300.", m_params.slice.resolution);
    }
    if (m_params.slice.refresh_interval <= 0) {
        LOG_ERROR("Slice `refresh_interval` must be positive, got {}.", m_params.slice.refresh_interval);
        ok = false;
    }

    if (m_params.free_stream_velocity < 0.0) {
        LOG_WARN("Negative free-stream velocity {}: the stream runs towards the entry plane.", m_params.free_stream_velocity);
    }

    if (ok) {
        LOG_INFO("Configuration validated.");
    }
    return ok;
}

} // namespace pflow
