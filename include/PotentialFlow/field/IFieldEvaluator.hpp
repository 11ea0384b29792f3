// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "PotentialFlow/common/Types.hpp"
#include "PotentialFlow/field/FlowTypes.hpp"

namespace pflow
{

    namespace field
    {

        // runtime failure of an evaluator kernel; recoverable by switching kernels
        class EvaluatorError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        /**
         * @brief Batch entry points of a potential-flow field evaluator.
         *
         * Buffers are interleaved 3-vectors in world space. Implementations are pure:
         * they keep no state between calls and never retain the buffers they are given,
         * so any two implementations can be swapped tick by tick.
         */
        class IFieldEvaluator
        {
        public:
            virtual ~IFieldEvaluator() = default;

            virtual const char *name() const = 0;

            // velocities must hold 3 * count floats
            void evaluate(const float *positions, std::size_t count,
                          const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                          float *velocities) const
            {
                if (count == 0)
                    return;
                doEvaluate(positions, count, flow, obstacle, velocities);
            }

            // pressures must hold count floats
            void evaluatePressure(const float *velocities, std::size_t count,
                                  real free_stream_velocity, real fluid_density,
                                  float *pressures) const
            {
                if (count == 0)
                    return;
                doEvaluatePressure(velocities, count, free_stream_velocity, fluid_density, pressures);
            }

            // reuses the storage of `velocities`; it only grows when count grows
            void evaluate(const FlatBuffer &positions, std::size_t count,
                          const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                          FlatBuffer &velocities) const;

            FlatBuffer evaluate(const FlatBuffer &positions, std::size_t count,
                                const FlowParameters &flow, const ObstacleDescriptor &obstacle) const;

            void evaluatePressure(const FlatBuffer &velocities, std::size_t count,
                                  real free_stream_velocity, real fluid_density,
                                  FlatBuffer &pressures) const;

            FlatBuffer evaluatePressure(const FlatBuffer &velocities, std::size_t count,
                                        real free_stream_velocity, real fluid_density) const;

        protected:
            virtual void doEvaluate(const float *positions, std::size_t count,
                                    const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                                    float *velocities) const = 0;

            virtual void doEvaluatePressure(const float *velocities, std::size_t count,
                                            real free_stream_velocity, real fluid_density,
                                            float *pressures) const = 0;
        };

    } // namespace field

} // namespace pflow
