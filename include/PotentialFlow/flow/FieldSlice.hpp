// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <array>
#include <string>
#include <vector>

#include "PotentialFlow/common/Types.hpp"
#include "PotentialFlow/field/FlowTypes.hpp"
#include "PotentialFlow/field/IFieldEvaluator.hpp"
#include "PotentialFlow/flow/Tunnel.hpp"

namespace pflow
{

    namespace flow
    {

        enum class SliceAxis
        {
            None,
            X,
            Y,
            Z,
        };

        enum class FieldMode
        {
            None,
            Velocity,
            Pressure,
        };

        SliceAxis sliceAxisFromName(const std::string &name);
        FieldMode fieldModeFromName(const std::string &name);
        const char *sliceAxisName(SliceAxis axis);
        const char *fieldModeName(FieldMode mode);

        struct SliceSettings
        {
            FieldMode mode = FieldMode::None;
            SliceAxis axis = SliceAxis::None;
            real position = 0.0; // plane offset along `axis`
            int resolution = 20; // points per side
            int refresh_interval = 30;

            bool active() const { return mode != FieldMode::None && axis != SliceAxis::None; }
        };

        /**
         * @brief resolution x resolution sample grid on an axis-aligned plane of the tunnel.
         *
         * Point (i, j) is stored at index i * resolution + j. The first lattice index runs
         * along the lower of the two in-plane axes (x before y before z), the second along
         * the other one. A slice is immutable; any change means building a new one.
         */
        class FieldSlice
        {
        public:
            // throws std::invalid_argument for resolution < 2 or an inactive mode/axis
            static FieldSlice build(const SliceSettings &settings, const Tunnel &tunnel,
                                    const TickParameters &params, const field::IFieldEvaluator &evaluator);

            // lattice point positions for a plane; exposed for hosts that only need the layout
            static FlatBuffer latticePoints(SliceAxis axis, real position, int resolution, const Tunnel &tunnel);

            // closed polyline around the plane, first point repeated last
            static std::array<vec3_t, 5> outlineFor(SliceAxis axis, real position, const Tunnel &tunnel);

            // map `t` in [0, 1] to the colour ramp of `mode`
            static vec3_t colorFor(FieldMode mode, real t);

            FieldMode mode() const { return m_mode; }
            SliceAxis axis() const { return m_axis; }
            real position() const { return m_position; }
            int resolution() const { return m_resolution; }
            std::size_t pointCount() const { return static_cast<std::size_t>(m_resolution) * m_resolution; }

            const FlatBuffer &points() const { return m_points; }
            const FlatBuffer &velocities() const { return m_velocities; }
            const std::vector<float> &values() const { return m_values; }
            const FlatBuffer &colors() const { return m_colors; }
            const std::array<vec3_t, 5> &outline() const { return m_outline; }

            real rangeMin() const { return m_range_min; }
            real rangeMax() const { return m_range_max; }

        private:
            FieldSlice() = default;

            void computeColors(const FlowParameters &flow);

            FieldMode m_mode = FieldMode::None;
            SliceAxis m_axis = SliceAxis::None;
            real m_position = 0.0;
            int m_resolution = 0;

            FlatBuffer m_points;
            FlatBuffer m_velocities;
            std::vector<float> m_values;
            FlatBuffer m_colors;
            std::array<vec3_t, 5> m_outline;

            real m_range_min = 0.0;
            real m_range_max = 0.0;
        };

    } // namespace flow

} // namespace pflow
