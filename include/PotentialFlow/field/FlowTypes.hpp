// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <string>

#include "PotentialFlow/common/Types.hpp"
#include "PotentialFlow/field/FieldConstants.hpp"
#include "PotentialFlow/utils/Logger.hpp"

namespace pflow
{

    // wire codes are shared with the host renderer
    enum class ObstacleKind : int
    {
        Sphere = 0,
        Cylinder = 1,
        Airfoil = 2,
    };

    ObstacleKind obstacleKindFromCode(int code);
    ObstacleKind obstacleKindFromName(const std::string &name);
    const char *obstacleKindName(ObstacleKind kind);

    inline int obstacleKindCode(ObstacleKind kind) { return static_cast<int>(kind); }

    struct ObstacleDescriptor
    {
        ObstacleKind kind = ObstacleKind::Sphere;
        vec3_t position = vec3_t(0.0);
        real radius = field::kObstacleRadius;
    };

    struct FlowParameters
    {
        real free_stream_velocity = 1.0; // not clamped, negative speeds reverse the stream
        real fluid_density = 1.0;
    };

    // everything the evaluator and the advection need for one tick
    struct TickParameters
    {
        FlowParameters flow;
        ObstacleDescriptor obstacle;
    };

} // namespace pflow

template <>
struct fmt::formatter<pflow::ObstacleKind> : fmt::formatter<const char *>
{
    auto format(pflow::ObstacleKind kind, format_context &ctx) const
    {
        return fmt::formatter<const char *>::format(pflow::obstacleKindName(kind), ctx);
    }
};
