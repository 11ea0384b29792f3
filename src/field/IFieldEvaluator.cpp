// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/field/IFieldEvaluator.hpp"

namespace pflow
{

    namespace field
    {

        namespace
        {
            void requireSize(const FlatBuffer &buffer, std::size_t expected, const char *what)
            {
                if (buffer.size() < expected)
                {
                    throw std::invalid_argument(fmt::format(
                        "{} buffer holds {} floats but {} are required.", what, buffer.size(), expected));
                }
            }
        } // namespace

        void IFieldEvaluator::evaluate(const FlatBuffer &positions, std::size_t count,
                                       const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                                       FlatBuffer &velocities) const
        {
            requireSize(positions, count * 3, "Position");
            velocities.resize(count * 3);
            evaluate(positions.data(), count, flow, obstacle, velocities.data());
        }

        FlatBuffer IFieldEvaluator::evaluate(const FlatBuffer &positions, std::size_t count,
                                             const FlowParameters &flow, const ObstacleDescriptor &obstacle) const
        {
            FlatBuffer velocities;
            evaluate(positions, count, flow, obstacle, velocities);
            return velocities;
        }

        void IFieldEvaluator::evaluatePressure(const FlatBuffer &velocities, std::size_t count,
                                               real free_stream_velocity, real fluid_density,
                                               FlatBuffer &pressures) const
        {
            requireSize(velocities, count * 3, "Velocity");
            pressures.resize(count);
            evaluatePressure(velocities.data(), count, free_stream_velocity, fluid_density, pressures.data());
        }

        FlatBuffer IFieldEvaluator::evaluatePressure(const FlatBuffer &velocities, std::size_t count,
                                                     real free_stream_velocity, real fluid_density) const
        {
            FlatBuffer pressures;
            evaluatePressure(velocities, count, free_stream_velocity, fluid_density, pressures);
            return pressures;
        }

    } // namespace field

} // namespace pflow
