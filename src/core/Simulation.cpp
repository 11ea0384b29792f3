// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/core/Simulation.hpp"
#include "PotentialFlow/io/VtkWriter.hpp"
#include "PotentialFlow/utils/Logger.hpp"
#include "PotentialFlow/utils/Profiler.hpp"

#include <filesystem>
#include <stdexcept>

namespace pflow
{
    Simulation::Simulation(const SimulationParameters &params)
        : m_params(params),
          m_tick(params.tickParameters()),
          m_slice_settings(params.sliceSettings())
    {
        if (!m_params.tunnel.isValid())
        {
            throw std::invalid_argument("Simulation requires a tunnel with entry_x < exit_x and positive width and height.");
        }
        if (m_params.particle_count <= 0)
        {
            throw std::invalid_argument(fmt::format("Particle count must be positive, got {}.", m_params.particle_count));
        }
        validateSliceSettings(m_slice_settings);
    }

    void Simulation::validateSliceSettings(const flow::SliceSettings &settings)
    {
        if (settings.resolution < 2)
        {
            throw std::invalid_argument(fmt::format("Slice resolution must be at least 2, got {}.", settings.resolution));
        }
        if (settings.refresh_interval <= 0)
        {
            throw std::invalid_argument(fmt::format("Slice refresh interval must be positive, got {}.", settings.refresh_interval));
        }
    }

    void Simulation::initialize()
    {
        PROFILE_FUNCTION();

        m_evaluator = field::createFieldEvaluator(m_params.evaluatorBackend(),
                                                  m_params.validate_output,
                                                  m_params.max_primary_failures);

        m_particles = std::make_unique<flow::ParticleSystem>(m_params.tunnel, m_params.random_seed);
        m_particles->initialize(static_cast<std::size_t>(m_params.particle_count), m_tick.flow.free_stream_velocity);
        m_tick_count = 0;

        if (m_params.output_frequency > 0 && !m_params.output_path.empty())
        {
            createOutputDirectory();
        }
        else
        {
            LOG_WARN("Output is disabled (output_frequency <= 0 or output_path is empty).");
        }

        rebuildSlice();

        LOG_INFO("Simulation initialized: {} particles, {} obstacle at {}, U = {}, rho = {}, evaluator '{}'.",
                 m_particles->size(), m_tick.obstacle.kind, m_tick.obstacle.position, m_tick.flow.free_stream_velocity,
                 m_tick.flow.fluid_density, m_evaluator->activeBackend());
    }

    void Simulation::createOutputDirectory() const
    {
        try
        {
            std::filesystem::path out_path(m_params.output_path);

            if (std::filesystem::create_directories(out_path))
            {
                LOG_INFO("Output directory created successfully: '{}'", m_params.output_path);
            }
            else
            {
                LOG_INFO("Output directory already exists: '{}'", m_params.output_path);
            }
        }
        catch (const std::filesystem::filesystem_error &e)
        {
            LOG_CRITICAL("Failed to create or access output directory '{}'. Error: {}", m_params.output_path, e.what());
        }
    }

    void Simulation::reset()
    {
        PROFILE_FUNCTION();
        requireInitialized();

        // same seed as initialize(), so a reset run replays the first one
        m_particles = std::make_unique<flow::ParticleSystem>(m_params.tunnel, m_params.random_seed);
        m_particles->initialize(static_cast<std::size_t>(m_params.particle_count), m_tick.flow.free_stream_velocity);
        m_tick_count = 0;
        rebuildSlice();
    }

    void Simulation::step()
    {
        PROFILE_FUNCTION();
        requireInitialized();

        m_particles->advance(m_tick, *m_evaluator);
        ++m_tick_count;

        if (m_particles->recycledLastTick() > 0)
        {
            LOG_TRACE("Tick {}: {} particles recycled.", m_tick_count, m_particles->recycledLastTick());
        }

        if (m_slice_settings.active() && m_tick_count % m_slice_settings.refresh_interval == 0)
        {
            rebuildSlice();
        }
    }

    void Simulation::setFreeStreamVelocity(real velocity)
    {
        m_tick.flow.free_stream_velocity = velocity;
        m_params.free_stream_velocity = velocity;
        onFlowChanged();
    }

    void Simulation::setFluidDensity(real density)
    {
        m_tick.flow.fluid_density = density;
        m_params.fluid_density = density;
        onFlowChanged();
    }

    void Simulation::setObstacleKind(ObstacleKind kind)
    {
        m_tick.obstacle.kind = kind;
        m_params.obstacle_type = obstacleKindName(kind);
        onFlowChanged();
    }

    void Simulation::setObstaclePosition(const vec3_t &position)
    {
        m_tick.obstacle.position = position;
        m_params.obstacle_position = {position.x, position.y, position.z};
        onFlowChanged();
    }

    void Simulation::setParticleCount(int count)
    {
        if (count <= 0)
        {
            throw std::invalid_argument(fmt::format("Particle count must be positive, got {}.", count));
        }
        if (count == m_params.particle_count)
        {
            return;
        }

        m_params.particle_count = count;
        if (isInitialized())
        {
            m_particles->initialize(static_cast<std::size_t>(count), m_tick.flow.free_stream_velocity);
        }
    }

    void Simulation::setSliceSettings(const flow::SliceSettings &settings)
    {
        validateSliceSettings(settings);
        m_slice_settings = settings;
        onFlowChanged();
    }

    void Simulation::setSliceMode(flow::FieldMode mode)
    {
        flow::SliceSettings settings = m_slice_settings;
        settings.mode = mode;
        setSliceSettings(settings);
    }

    void Simulation::setSliceAxis(flow::SliceAxis axis)
    {
        flow::SliceSettings settings = m_slice_settings;
        settings.axis = axis;
        setSliceSettings(settings);
    }

    void Simulation::setSlicePosition(real position)
    {
        flow::SliceSettings settings = m_slice_settings;
        settings.position = position;
        setSliceSettings(settings);
    }

    void Simulation::setSliceResolution(int resolution)
    {
        flow::SliceSettings settings = m_slice_settings;
        settings.resolution = resolution;
        setSliceSettings(settings);
    }

    void Simulation::onFlowChanged()
    {
        if (isInitialized())
        {
            rebuildSlice();
        }
    }

    void Simulation::rebuildSlice()
    {
        if (!m_slice_settings.active())
        {
            m_slice.reset();
            return;
        }
        m_slice = flow::FieldSlice::build(m_slice_settings, m_params.tunnel, m_tick, *m_evaluator);
    }

    const field::FallbackFieldEvaluator &Simulation::evaluator() const
    {
        requireInitialized();
        return *m_evaluator;
    }

    const flow::ParticleSystem &Simulation::particles() const
    {
        requireInitialized();
        return *m_particles;
    }

    std::vector<float> Simulation::pressures() const
    {
        requireInitialized();
        std::vector<float> result;
        m_evaluator->evaluatePressure(m_particles->velocities(), m_particles->size(),
                                      m_tick.flow.free_stream_velocity, m_tick.flow.fluid_density, result);
        return result;
    }

    void Simulation::requireInitialized() const
    {
        if (!m_particles || !m_evaluator)
        {
            throw std::logic_error("Simulation::initialize() must be called first.");
        }
    }

    bool Simulation::saveFrameData(int frame_index) const
    {
        PROFILE_FUNCTION();
        requireInitialized();

        bool ok = writeParticles(fmt::format("{}/particles_{:04d}.vtu", m_params.output_path, frame_index));

        if (m_slice)
        {
            ok = writeSlice(fmt::format("{}/slice_{:04d}.vti", m_params.output_path, frame_index),
                            fmt::format("{}/slice_outline_{:04d}.vtu", m_params.output_path, frame_index)) &&
                 ok;
        }
        return ok;
    }

    bool Simulation::writeParticles(const std::string &filepath) const
    {
        const std::size_t n = m_particles->size();
        const FlatBuffer &positions = m_particles->positions();

        std::vector<glm::vec<3, float>> vertices(n);
        std::vector<uint32_t> vertex_cells(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            vertices[i] = glm::vec<3, float>(positions[i * 3 + 0], positions[i * 3 + 1], positions[i * 3 + 2]);
            vertex_cells[i] = static_cast<uint32_t>(i);
        }

        const std::vector<float> pressure = pressures();
        const std::vector<std::pair<VtkCellType, std::vector<uint32_t>>> cells = {{VtkCellType::Vertex, vertex_cells}};
        return io::VtkWriter::writeUnstructuredGrid(filepath, vertices, cells,
                                                    {{"velocity", m_particles->velocities().data(), 3},
                                                     {"pressure", pressure.data(), 1}});
    }

    bool Simulation::writeSlice(const std::string &filepath, const std::string &outline_filepath) const
    {
        const flow::FieldSlice &slice = *m_slice;
        const flow::Tunnel &tunnel = m_params.tunnel;
        const int res = slice.resolution();
        const real step = 1.0 / static_cast<real>(res - 1);

        int nx = res, ny = res, nz = res;
        glm::dvec3 spacing(1.0);
        glm::dvec3 origin(tunnel.entry_x, -tunnel.halfWidth(), -tunnel.halfHeight());
        switch (slice.axis())
        {
        case flow::SliceAxis::X:
            nx = 1;
            spacing = glm::dvec3(1.0, tunnel.width * step, tunnel.height * step);
            origin.x = slice.position();
            break;
        case flow::SliceAxis::Y:
            ny = 1;
            spacing = glm::dvec3(tunnel.length() * step, 1.0, tunnel.height * step);
            origin.y = slice.position();
            break;
        case flow::SliceAxis::Z:
        case flow::SliceAxis::None:
            nz = 1;
            spacing = glm::dvec3(tunnel.length() * step, tunnel.width * step, 1.0);
            origin.z = slice.position();
            break;
        }

        // slice storage is (i * res + j) with j fastest, VTK wants the first in-plane axis fastest
        const std::size_t n = slice.pointCount();
        std::vector<float> values(n);
        FlatBuffer colors(n * 3);
        FlatBuffer velocities(n * 3);
        for (int i = 0; i < res; ++i)
        {
            for (int j = 0; j < res; ++j)
            {
                const std::size_t src = static_cast<std::size_t>(i) * res + j;
                const std::size_t dst = static_cast<std::size_t>(j) * res + i;
                values[dst] = slice.values()[src];
                storeVec3(colors.data(), dst, loadVec3(slice.colors().data(), src));
                storeVec3(velocities.data(), dst, loadVec3(slice.velocities().data(), src));
            }
        }

        const bool image_ok = io::VtkWriter::writeImageData(filepath, nx, ny, nz, spacing, origin,
                                                            {{"value", values.data(), 1},
                                                             {"color", colors.data(), 3},
                                                             {"velocity", velocities.data(), 3}});

        const std::vector<glm::dvec3> outline(slice.outline().begin(), slice.outline().end());
        const std::vector<uint32_t> segments = {0, 1, 1, 2, 2, 3, 3, 4};
        const std::vector<std::pair<VtkCellType, std::vector<uint32_t>>> cells = {{VtkCellType::Line, segments}};
        const bool outline_ok = io::VtkWriter::writeUnstructuredGrid(outline_filepath, outline, cells);

        return image_ok && outline_ok;
    }

} // namespace pflow
