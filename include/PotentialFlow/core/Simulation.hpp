// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once
#include "PotentialFlow/utils/Config.hpp"
#include "PotentialFlow/field/EvaluatorSelection.hpp"
#include "PotentialFlow/flow/FieldSlice.hpp"
#include "PotentialFlow/flow/ParticleSystem.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pflow {

// Owns the particle set, the evaluator strategy and the current field slice,
// and advances them one tick at a time on behalf of the host.
class Simulation {
public:
    // throws std::invalid_argument for parameters that Config::load would reject
    explicit Simulation(const SimulationParameters& params);

    void initialize();
    void reset();
    void step();

    // --- flow and obstacle; an active slice is rebuilt immediately ---
    void setFreeStreamVelocity(real velocity);
    void setFluidDensity(real density);
    void setObstacleKind(ObstacleKind kind);
    void setObstaclePosition(const vec3_t& position);

    // reallocates and reseeds every particle when the count changes
    void setParticleCount(int count);

    // --- slice ---
    void setSliceSettings(const flow::SliceSettings& settings);
    void setSliceMode(flow::FieldMode mode);
    void setSliceAxis(flow::SliceAxis axis);
    void setSlicePosition(real position);
    void setSliceResolution(int resolution);

    // particles_XXXX.vtu, plus slice_XXXX.vti and its outline while a slice is active
    bool saveFrameData(int frame_index) const;

    bool isInitialized() const { return m_particles != nullptr; }
    long long tickCount() const { return m_tick_count; }

    const TickParameters& tickParameters() const { return m_tick; }
    const flow::SliceSettings& sliceSettings() const { return m_slice_settings; }
    const flow::Tunnel& tunnel() const { return m_params.tunnel; }
    const SimulationParameters& params() const { return m_params; }

    const field::FallbackFieldEvaluator& evaluator() const;
    const flow::ParticleSystem& particles() const;

    std::size_t particleCount() const { return particles().size(); }
    const FlatBuffer& positions() const { return particles().positions(); }
    const FlatBuffer& velocities() const { return particles().velocities(); }

    // Bernoulli pressure at every particle, from its current velocity
    std::vector<float> pressures() const;

    // nullptr while no slice is active
    const flow::FieldSlice* slice() const { return m_slice ? &*m_slice : nullptr; }

private:
    static void validateSliceSettings(const flow::SliceSettings& settings);
    void requireInitialized() const;
    void createOutputDirectory() const;
    void onFlowChanged();
    void rebuildSlice();

    bool writeParticles(const std::string& filepath) const;
    bool writeSlice(const std::string& filepath, const std::string& outline_filepath) const;

    SimulationParameters m_params;
    TickParameters m_tick;
    flow::SliceSettings m_slice_settings;

    std::unique_ptr<field::FallbackFieldEvaluator> m_evaluator;
    std::unique_ptr<flow::ParticleSystem> m_particles;
    std::optional<flow::FieldSlice> m_slice;

    long long m_tick_count = 0;
};

} // namespace pflow
