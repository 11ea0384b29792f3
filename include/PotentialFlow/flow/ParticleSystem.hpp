// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <cstddef>
#include <random>

#include "PotentialFlow/common/Types.hpp"
#include "PotentialFlow/field/FlowTypes.hpp"
#include "PotentialFlow/field/IFieldEvaluator.hpp"
#include "PotentialFlow/flow/Tunnel.hpp"

namespace pflow
{

    namespace flow
    {

        /**
         * @brief Fixed-size particle set advected through the evaluated field.
         *
         * Positions and velocities are interleaved float buffers so they can be handed
         * to the host renderer as they are. The particle count only changes through
         * initialize(), which reallocates and reseeds everything.
         */
        class ParticleSystem
        {
        public:
            explicit ParticleSystem(const Tunnel &tunnel, unsigned int seed = 42);

            // reallocate `count` particles spread over the whole tunnel, moving with the free stream
            void initialize(std::size_t count, real free_stream_velocity);

            // one tick: evaluate, smooth, integrate, recycle
            void advance(const TickParameters &params, const field::IFieldEvaluator &evaluator);

            std::size_t size() const { return m_count; }
            const Tunnel &tunnel() const { return m_tunnel; }

            const FlatBuffer &positions() const { return m_positions; }
            const FlatBuffer &velocities() const { return m_velocities; }

            vec3_t position(std::size_t i) const { return loadVec3(m_positions.data(), i); }
            vec3_t velocity(std::size_t i) const { return loadVec3(m_velocities.data(), i); }

            // overwrite a single particle; used by hosts that place probes
            void setParticle(std::size_t i, const vec3_t &position, const vec3_t &velocity);

            std::size_t recycledLastTick() const { return m_recycled_last_tick; }
            long long tickCount() const { return m_tick_count; }

        private:
            // returns true if the particle was sent back to the entry plane
            bool recycle(vec3_t &p, vec3_t &v, real free_stream_velocity);

            Tunnel m_tunnel;
            std::mt19937 m_rng;
            std::uniform_real_distribution<real> m_unit{0.0, 1.0};

            std::size_t m_count = 0;
            FlatBuffer m_positions;
            FlatBuffer m_velocities;
            FlatBuffer m_targets; // evaluator output, reused every tick

            std::size_t m_recycled_last_tick = 0;
            long long m_tick_count = 0;
        };

    } // namespace flow

} // namespace pflow
