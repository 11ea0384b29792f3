// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/flow/ParticleSystem.hpp"
#include "PotentialFlow/field/FieldConstants.hpp"
#include "PotentialFlow/utils/Logger.hpp"
#include "PotentialFlow/utils/Profiler.hpp"

#include <stdexcept>

namespace pflow
{

    namespace flow
    {

        ParticleSystem::ParticleSystem(const Tunnel &tunnel, unsigned int seed)
            : m_tunnel(tunnel), m_rng(seed)
        {
            if (!m_tunnel.isValid())
            {
                throw std::invalid_argument("ParticleSystem requires a tunnel with entry_x < exit_x and positive width and height.");
            }
        }

        void ParticleSystem::initialize(std::size_t count, real free_stream_velocity)
        {
            PROFILE_FUNCTION();

            // fresh buffers, never resized in place
            FlatBuffer positions(count * 3);
            FlatBuffer velocities(count * 3);
            FlatBuffer targets(count * 3);

            for (std::size_t i = 0; i < count; ++i)
            {
                const vec3_t p(
                    m_tunnel.entry_x + m_unit(m_rng) * m_tunnel.length(),
                    -m_tunnel.halfWidth() + m_unit(m_rng) * m_tunnel.width,
                    -m_tunnel.halfHeight() + m_unit(m_rng) * m_tunnel.height);
                storeVec3(positions.data(), i, p);
                storeVec3(velocities.data(), i, vec3_t(free_stream_velocity, 0.0, 0.0));
            }

            m_positions.swap(positions);
            m_velocities.swap(velocities);
            m_targets.swap(targets);
            m_count = count;
            m_recycled_last_tick = 0;
            m_tick_count = 0;

            LOG_INFO("Particle set initialized with {} particles in tunnel x [{}, {}], {} x {}.",
                     m_count, m_tunnel.entry_x, m_tunnel.exit_x, m_tunnel.width, m_tunnel.height);
        }

        void ParticleSystem::setParticle(std::size_t i, const vec3_t &position, const vec3_t &velocity)
        {
            if (i >= m_count)
            {
                throw std::out_of_range(fmt::format("Particle index {} out of range for {} particles.", i, m_count));
            }
            storeVec3(m_positions.data(), i, position);
            storeVec3(m_velocities.data(), i, velocity);
        }

        bool ParticleSystem::recycle(vec3_t &p, vec3_t &v, real free_stream_velocity)
        {
            if (!m_tunnel.exitedAxially(p) && !m_tunnel.exitedLaterally(p))
            {
                return false;
            }

            p.x = m_tunnel.entry_x;

            // checked on its own after the x reset: a particle leaving through the exit
            // plane and a side wall at once takes the lateral re-seed as well
            if (m_tunnel.exitedLaterally(p))
            {
                p.y = (m_unit(m_rng) - 0.5) * m_tunnel.width * kRecycleSpread;
                p.z = (m_unit(m_rng) - 0.5) * m_tunnel.height * kRecycleSpread;
            }

            v = vec3_t(free_stream_velocity, 0.0, 0.0);
            return true;
        }

        void ParticleSystem::advance(const TickParameters &params, const field::IFieldEvaluator &evaluator)
        {
            PROFILE_FUNCTION();

            if (m_count == 0)
            {
                return;
            }

            {
                PROFILE_SCOPE("Field Evaluation");
                evaluator.evaluate(m_positions.data(), m_count, params.flow, params.obstacle, m_targets.data());
            }

            const real U = params.flow.free_stream_velocity;
            std::size_t recycled = 0;

            for (std::size_t i = 0; i < m_count; ++i)
            {
                vec3_t p = loadVec3(m_positions.data(), i);
                vec3_t v = loadVec3(m_velocities.data(), i);
                const vec3_t target = loadVec3(m_targets.data(), i);

                v = v * kVelocityRetention + target * kVelocityBlend;
                p += v * kTimeStep;

                if (recycle(p, v, U))
                {
                    ++recycled;
                }

                storeVec3(m_positions.data(), i, p);
                storeVec3(m_velocities.data(), i, v);
            }

            m_recycled_last_tick = recycled;
            ++m_tick_count;
        }

    } // namespace flow

} // namespace pflow
