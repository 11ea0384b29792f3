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
         * @brief Vectorised evaluator working on fixed-capacity blocks of points.
         *
         * Each block is held in stack-allocated Eigen arrays, so a call allocates nothing.
         * Branches of the per-point formulas become masks; the airfoil angle is never
         * formed, its harmonics are taken from the Cartesian components directly.
         *
         * With output validation on, a non-finite velocity computed from a finite
         * position raises EvaluatorError.
         */
        class BatchFieldEvaluator : public IFieldEvaluator
        {
        public:
            explicit BatchFieldEvaluator(bool validate_output = true)
                : m_validate_output(validate_output) {}

            const char *name() const override { return "batch"; }

            bool validatesOutput() const { return m_validate_output; }

        protected:
            void doEvaluate(const float *positions, std::size_t count,
                            const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                            float *velocities) const override;

            void doEvaluatePressure(const float *velocities, std::size_t count,
                                    real free_stream_velocity, real fluid_density,
                                    float *pressures) const override;

        private:
            bool m_validate_output;
        };

    } // namespace field

} // namespace pflow
