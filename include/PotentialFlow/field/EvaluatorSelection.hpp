// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <memory>
#include <string>

#include "PotentialFlow/field/IFieldEvaluator.hpp"

namespace pflow
{

    namespace field
    {

        enum class EvaluatorBackend
        {
            Auto,   // probe the batch kernel, fall back to scalar on failure
            Batch,  // same as Auto, but a failed probe is reported as an error
            Scalar, // skip the probe
        };

        EvaluatorBackend evaluatorBackendFromName(const std::string &name);
        const char *evaluatorBackendName(EvaluatorBackend backend);

        // outcome of the start-up capability probe; never thrown
        struct ProbeResult
        {
            bool available = false;
            std::string reason;
            std::unique_ptr<IFieldEvaluator> evaluator;
        };

        // builds the batch kernel and checks it against the scalar kernel on reference points
        ProbeResult probeBatchEvaluator(bool validate_output = true);

        /**
         * @brief Primary/fallback pair with a per-call retry.
         *
         * A call that throws on the primary is recomputed by the fallback for that call only.
         * After `max_primary_failures` consecutive failures the primary is dropped for the
         * rest of the session; 0 never drops it. A successful call resets the streak.
         */
        class FallbackFieldEvaluator : public IFieldEvaluator
        {
        public:
            FallbackFieldEvaluator(std::unique_ptr<IFieldEvaluator> primary,
                                   std::unique_ptr<IFieldEvaluator> fallback,
                                   int max_primary_failures = 3);

            const char *name() const override { return activeBackend(); }

            const char *activeBackend() const;
            bool hasPrimary() const { return m_primary != nullptr; }
            bool primaryDemoted() const { return m_demoted; }
            int consecutiveFailures() const { return m_consecutive_failures; }
            long long totalFailures() const { return m_total_failures; }
            int maxPrimaryFailures() const { return m_max_primary_failures; }

        protected:
            void doEvaluate(const float *positions, std::size_t count,
                            const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                            float *velocities) const override;

            void doEvaluatePressure(const float *velocities, std::size_t count,
                                    real free_stream_velocity, real fluid_density,
                                    float *pressures) const override;

        private:
            template <typename Call>
            void dispatch(const char *what, Call &&call) const;

            std::unique_ptr<IFieldEvaluator> m_primary;
            std::unique_ptr<IFieldEvaluator> m_fallback;
            int m_max_primary_failures;

            // failure bookkeeping only; the evaluation itself stays pure
            mutable bool m_demoted = false;
            mutable int m_consecutive_failures = 0;
            mutable long long m_total_failures = 0;
        };

        // probe (unless Scalar is requested) and wrap the result with the scalar fallback
        std::unique_ptr<FallbackFieldEvaluator> createFieldEvaluator(EvaluatorBackend backend,
                                                                     bool validate_output = true,
                                                                     int max_primary_failures = 3);

    } // namespace field

} // namespace pflow
