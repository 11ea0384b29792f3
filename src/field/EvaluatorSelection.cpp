// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/field/EvaluatorSelection.hpp"
#include "PotentialFlow/field/BatchFieldEvaluator.hpp"
#include "PotentialFlow/field/ScalarFieldEvaluator.hpp"
#include "PotentialFlow/utils/Logger.hpp"
#include "PotentialFlow/utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace pflow
{

    namespace field
    {

        EvaluatorBackend evaluatorBackendFromName(const std::string &name)
        {
            const std::string lowered = utils::toLower(name);
            if (lowered == "auto")
                return EvaluatorBackend::Auto;
            if (lowered == "batch")
                return EvaluatorBackend::Batch;
            if (lowered == "scalar")
                return EvaluatorBackend::Scalar;

            throw std::runtime_error("Unknown evaluator_backend '" + name + "'. Supported backends are 'auto', 'batch' and 'scalar'.");
        }

        const char *evaluatorBackendName(EvaluatorBackend backend)
        {
            switch (backend)
            {
            case EvaluatorBackend::Auto:
                return "auto";
            case EvaluatorBackend::Batch:
                return "batch";
            case EvaluatorBackend::Scalar:
                return "scalar";
            }
            return "unknown";
        }

        ProbeResult probeBatchEvaluator(bool validate_output)
        {
            ProbeResult result;

            // on-axis, lateral, off-plane and interior points
            const std::array<float, 15> samples = {
                2.0f, 0.0f, 0.0f,
                0.0f, 2.0f, 0.0f,
                1.5f, -1.25f, 0.75f,
                -3.0f, 0.5f, -2.0f,
                0.25f, 0.25f, 0.25f};
            const std::size_t n_samples = samples.size() / 3;
            const FlowParameters flow{1.0, 1.0};

            try
            {
                auto batch = std::make_unique<BatchFieldEvaluator>(validate_output);
                const ScalarFieldEvaluator reference{};

                std::array<float, 15> got{};
                std::array<float, 15> expected{};

                for (ObstacleKind kind : {ObstacleKind::Sphere, ObstacleKind::Cylinder, ObstacleKind::Airfoil})
                {
                    ObstacleDescriptor obstacle;
                    obstacle.kind = kind;

                    batch->evaluate(samples.data(), n_samples, flow, obstacle, got.data());
                    reference.evaluate(samples.data(), n_samples, flow, obstacle, expected.data());

                    for (std::size_t i = 0; i < got.size(); ++i)
                    {
                        const double tol = 1e-5 * std::max(1.0, std::abs(static_cast<double>(expected[i])));
                        if (!(std::abs(got[i] - expected[i]) <= tol))
                        {
                            result.reason = fmt::format("self-test mismatch for {} at component {}: batch {} vs scalar {}",
                                                        kind, i, got[i], expected[i]);
                            return result;
                        }
                    }
                }

                // sphere dipole on the axis at r = 2: vx = 1 - (1/8) * 1
                ObstacleDescriptor sphere;
                batch->evaluate(samples.data(), 1, flow, sphere, got.data());
                if (std::abs(got[0] - 0.875f) > 1e-6f)
                {
                    result.reason = fmt::format("reference sample returned vx = {} instead of 0.875", got[0]);
                    return result;
                }

                result.available = true;
                result.evaluator = std::move(batch);
            }
            catch (const std::exception &e)
            {
                result.reason = e.what();
            }
            return result;
        }

        FallbackFieldEvaluator::FallbackFieldEvaluator(std::unique_ptr<IFieldEvaluator> primary,
                                                       std::unique_ptr<IFieldEvaluator> fallback,
                                                       int max_primary_failures)
            : m_primary(std::move(primary)),
              m_fallback(std::move(fallback)),
              m_max_primary_failures(max_primary_failures)
        {
            if (!m_fallback)
            {
                throw std::invalid_argument("FallbackFieldEvaluator requires a fallback evaluator.");
            }
        }

        const char *FallbackFieldEvaluator::activeBackend() const
        {
            if (m_primary && !m_demoted)
            {
                return m_primary->name();
            }
            return m_fallback->name();
        }

        template <typename Call>
        void FallbackFieldEvaluator::dispatch(const char *what, Call &&call) const
        {
            if (m_primary && !m_demoted)
            {
                try
                {
                    call(*m_primary);
                    m_consecutive_failures = 0;
                    return;
                }
                catch (const std::exception &e)
                {
                    ++m_consecutive_failures;
                    ++m_total_failures;
                    LOG_WARN("'{}' evaluator failed during {} ({}). Recomputing with '{}'.",
                             m_primary->name(), what, e.what(), m_fallback->name());

                    if (m_max_primary_failures > 0 && m_consecutive_failures >= m_max_primary_failures)
                    {
                        m_demoted = true;
                        LOG_ERROR("'{}' evaluator failed {} times in a row; using '{}' for the rest of the session.",
                                  m_primary->name(), m_consecutive_failures, m_fallback->name());
                    }
                }
            }
            call(*m_fallback);
        }

        void FallbackFieldEvaluator::doEvaluate(const float *positions, std::size_t count,
                                                const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                                                float *velocities) const
        {
            dispatch("velocity evaluation", [&](const IFieldEvaluator &evaluator)
                     { evaluator.evaluate(positions, count, flow, obstacle, velocities); });
        }

        void FallbackFieldEvaluator::doEvaluatePressure(const float *velocities, std::size_t count,
                                                        real free_stream_velocity, real fluid_density,
                                                        float *pressures) const
        {
            dispatch("pressure evaluation", [&](const IFieldEvaluator &evaluator)
                     { evaluator.evaluatePressure(velocities, count, free_stream_velocity, fluid_density, pressures); });
        }

        std::unique_ptr<FallbackFieldEvaluator> createFieldEvaluator(EvaluatorBackend backend,
                                                                     bool validate_output,
                                                                     int max_primary_failures)
        {
            std::unique_ptr<IFieldEvaluator> primary;

            if (backend == EvaluatorBackend::Scalar)
            {
                LOG_INFO("Scalar evaluator selected by configuration; batch kernel not probed.");
            }
            else
            {
                ProbeResult probe = probeBatchEvaluator(validate_output);
                if (probe.available)
                {
                    LOG_INFO("Batch evaluator loaded (output validation {}).", validate_output ? "on" : "off");
                    primary = std::move(probe.evaluator);
                }
                else if (backend == EvaluatorBackend::Batch)
                {
                    LOG_ERROR("Batch evaluator was requested but is unavailable: {}. Continuing with the scalar evaluator.", probe.reason);
                }
                else
                {
                    LOG_WARN("Batch evaluator unavailable: {}. Continuing with the scalar evaluator.", probe.reason);
                }
            }

            return std::make_unique<FallbackFieldEvaluator>(std::move(primary),
                                                            std::make_unique<ScalarFieldEvaluator>(),
                                                            max_primary_failures);
        }

    } // namespace field

} // namespace pflow
