// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "PotentialFlow/field/IFieldEvaluator.hpp"

namespace pflow
{

    namespace field
    {

        /**
         * @brief Potential-flow velocity at a point relative to the obstacle centre.
         *
         * Every obstacle perturbs the free stream (U, 0, 0). Points with |rel| <= radius,
         * and for the 2D kinds points with sqrt(x^2 + y^2) <= radius, get exactly zero.
         * radius must be positive; this is not checked.
         */
        vec3_t evaluateVelocity(const vec3_t &rel, ObstacleKind kind, real radius,
                                real free_stream_velocity, real fluid_density);

        // Bernoulli pressure relative to the free-stream dynamic pressure
        real evaluatePressure(const vec3_t &velocity, real free_stream_velocity, real fluid_density);

        // Reference implementation: one point at a time through evaluateVelocity.
        class ScalarFieldEvaluator : public IFieldEvaluator
        {
        public:
            const char *name() const override { return "scalar"; }

        protected:
            void doEvaluate(const float *positions, std::size_t count,
                            const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                            float *velocities) const override;

            void doEvaluatePressure(const float *velocities, std::size_t count,
                                    real free_stream_velocity, real fluid_density,
                                    float *pressures) const override;
        };

    } // namespace field

} // namespace pflow
