// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/flow/FieldSlice.hpp"
#include "PotentialFlow/utils/Logger.hpp"
#include "PotentialFlow/utils/Profiler.hpp"
#include "PotentialFlow/utils/StringUtils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pflow
{

    namespace flow
    {

        SliceAxis sliceAxisFromName(const std::string &name)
        {
            const std::string lowered = utils::toLower(name);
            if (lowered == "none" || lowered.empty())
                return SliceAxis::None;
            if (lowered == "x")
                return SliceAxis::X;
            if (lowered == "y")
                return SliceAxis::Y;
            if (lowered == "z")
                return SliceAxis::Z;
            throw std::invalid_argument("Unknown slice axis '" + name + "'. Expected 'none', 'x', 'y' or 'z'.");
        }

        FieldMode fieldModeFromName(const std::string &name)
        {
            const std::string lowered = utils::toLower(name);
            if (lowered == "none" || lowered.empty())
                return FieldMode::None;
            if (lowered == "velocity")
                return FieldMode::Velocity;
            if (lowered == "pressure")
                return FieldMode::Pressure;
            throw std::invalid_argument("Unknown slice field '" + name + "'. Expected 'none', 'velocity' or 'pressure'.");
        }

        const char *sliceAxisName(SliceAxis axis)
        {
            switch (axis)
            {
            case SliceAxis::None:
                return "none";
            case SliceAxis::X:
                return "x";
            case SliceAxis::Y:
                return "y";
            case SliceAxis::Z:
                return "z";
            }
            return "unknown";
        }

        const char *fieldModeName(FieldMode mode)
        {
            switch (mode)
            {
            case FieldMode::None:
                return "none";
            case FieldMode::Velocity:
                return "velocity";
            case FieldMode::Pressure:
                return "pressure";
            }
            return "unknown";
        }

        FlatBuffer FieldSlice::latticePoints(SliceAxis axis, real position, int resolution, const Tunnel &tunnel)
        {
            if (resolution < 2)
            {
                throw std::invalid_argument(fmt::format("Slice resolution must be at least 2, got {}.", resolution));
            }
            if (axis == SliceAxis::None)
            {
                throw std::invalid_argument("Slice axis must be x, y or z.");
            }

            const std::size_t n = static_cast<std::size_t>(resolution);
            const real denom = static_cast<real>(resolution - 1);
            FlatBuffer points(n * n * 3);

            for (std::size_t i = 0; i < n; ++i)
            {
                const real u = static_cast<real>(i) / denom;
                for (std::size_t j = 0; j < n; ++j)
                {
                    const real w = static_cast<real>(j) / denom;
                    vec3_t p(0.0);
                    switch (axis)
                    {
                    case SliceAxis::X:
                        p = vec3_t(position, (u - 0.5) * tunnel.width, (w - 0.5) * tunnel.height);
                        break;
                    case SliceAxis::Y:
                        p = vec3_t(tunnel.entry_x + u * tunnel.length(), position, (w - 0.5) * tunnel.height);
                        break;
                    case SliceAxis::Z:
                        p = vec3_t(tunnel.entry_x + u * tunnel.length(), (w - 0.5) * tunnel.width, position);
                        break;
                    case SliceAxis::None:
                        break;
                    }
                    storeVec3(points.data(), i * n + j, p);
                }
            }
            return points;
        }

        std::array<vec3_t, 5> FieldSlice::outlineFor(SliceAxis axis, real position, const Tunnel &tunnel)
        {
            const real hw = tunnel.halfWidth();
            const real hh = tunnel.halfHeight();
            const real x0 = tunnel.entry_x;
            const real x1 = tunnel.exit_x;

            std::array<vec3_t, 5> corners;
            switch (axis)
            {
            case SliceAxis::X:
                corners = {vec3_t(position, -hw, -hh), vec3_t(position, hw, -hh), vec3_t(position, hw, hh),
                           vec3_t(position, -hw, hh), vec3_t(position, -hw, -hh)};
                break;
            case SliceAxis::Y:
                corners = {vec3_t(x0, position, -hh), vec3_t(x1, position, -hh), vec3_t(x1, position, hh),
                           vec3_t(x0, position, hh), vec3_t(x0, position, -hh)};
                break;
            case SliceAxis::Z:
            case SliceAxis::None:
                corners = {vec3_t(x0, -hw, position), vec3_t(x1, -hw, position), vec3_t(x1, hw, position),
                           vec3_t(x0, hw, position), vec3_t(x0, -hw, position)};
                break;
            }
            return corners;
        }

        vec3_t FieldSlice::colorFor(FieldMode mode, real t)
        {
            // blue -> white -> yellow for speed, blue -> green -> orange for pressure
            if (mode == FieldMode::Pressure)
            {
                return vec3_t(std::min(1.0, 2.0 * t),
                              std::min(1.0, 2.0 - 4.0 * std::abs(t - 0.5)),
                              std::min(1.0, 2.0 - 2.0 * t));
            }
            return vec3_t(std::min(1.0, 2.0 * t),
                          std::min(1.0, 2.0 * t),
                          std::min(1.0, 2.0 - 2.0 * t));
        }

        FieldSlice FieldSlice::build(const SliceSettings &settings, const Tunnel &tunnel,
                                     const TickParameters &params, const field::IFieldEvaluator &evaluator)
        {
            PROFILE_FUNCTION();

            if (!settings.active())
            {
                throw std::invalid_argument("Cannot build a field slice without a field mode and an axis.");
            }

            FieldSlice slice;
            slice.m_mode = settings.mode;
            slice.m_axis = settings.axis;
            slice.m_position = settings.position;
            slice.m_resolution = settings.resolution;
            slice.m_points = latticePoints(settings.axis, settings.position, settings.resolution, tunnel);
            slice.m_outline = outlineFor(settings.axis, settings.position, tunnel);

            const std::size_t n = slice.pointCount();
            evaluator.evaluate(slice.m_points, n, params.flow, params.obstacle, slice.m_velocities);

            slice.m_values.resize(n);
            if (settings.mode == FieldMode::Pressure)
            {
                evaluator.evaluatePressure(slice.m_velocities.data(), n,
                                           params.flow.free_stream_velocity, params.flow.fluid_density,
                                           slice.m_values.data());
            }
            else
            {
                for (std::size_t k = 0; k < n; ++k)
                {
                    slice.m_values[k] = static_cast<float>(glm::length(loadVec3(slice.m_velocities.data(), k)));
                }
            }

            slice.computeColors(params.flow);

            LOG_DEBUG("Built {} slice on {} = {} ({}x{}), range [{}, {}].",
                      fieldModeName(slice.m_mode), sliceAxisName(slice.m_axis), slice.m_position,
                      slice.m_resolution, slice.m_resolution, slice.m_range_min, slice.m_range_max);
            return slice;
        }

        void FieldSlice::computeColors(const FlowParameters &flow)
        {
            real lo = std::numeric_limits<real>::max();
            real hi = std::numeric_limits<real>::lowest();
            for (float v : m_values)
            {
                lo = std::min(lo, static_cast<real>(v));
                hi = std::max(hi, static_cast<real>(v));
            }

            if (m_mode == FieldMode::Velocity)
            {
                m_range_min = 0.0;
                m_range_max = hi * 1.2;
            }
            else
            {
                const real p_ref = 0.5 * flow.fluid_density * flow.free_stream_velocity * flow.free_stream_velocity;
                const real deviation = std::max(std::abs(hi - p_ref), std::abs(lo - p_ref));
                m_range_min = p_ref - deviation * 1.2;
                m_range_max = p_ref + deviation * 1.2;
            }

            const real span = m_range_max - m_range_min;
            m_colors.resize(m_values.size() * 3);
            for (std::size_t k = 0; k < m_values.size(); ++k)
            {
                // all samples equal: everything maps to the low end of the ramp
                const real t = span > 0.0 ? (m_values[k] - m_range_min) / span : 0.0;
                storeVec3(m_colors.data(), k, colorFor(m_mode, t));
            }
        }

    } // namespace flow

} // namespace pflow
