// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/field/FlowTypes.hpp"
#include "PotentialFlow/utils/StringUtils.hpp"

#include <array>
#include <stdexcept>

namespace pflow
{

    namespace
    {
        const std::array<const char *, 3> kKindNames = {"sphere", "cylinder", "airfoil"};
    }

    ObstacleKind obstacleKindFromCode(int code)
    {
        switch (code)
        {
        case 0:
            return ObstacleKind::Sphere;
        case 1:
            return ObstacleKind::Cylinder;
        case 2:
            return ObstacleKind::Airfoil;
        default:
            throw std::invalid_argument("Invalid obstacle kind code " + std::to_string(code) +
                                        ". Expected 0=sphere, 1=cylinder or 2=airfoil.");
        }
    }

    ObstacleKind obstacleKindFromName(const std::string &name)
    {
        const std::string lowered = utils::toLower(name);
        for (std::size_t i = 0; i < kKindNames.size(); ++i)
        {
            if (lowered == kKindNames[i])
            {
                return obstacleKindFromCode(static_cast<int>(i));
            }
        }
        throw std::invalid_argument("Unknown obstacle type '" + name + "'. Supported types are: " +
                                    utils::join(kKindNames) + ".");
    }

    const char *obstacleKindName(ObstacleKind kind)
    {
        switch (kind)
        {
        case ObstacleKind::Sphere:
            return kKindNames[0];
        case ObstacleKind::Cylinder:
            return kKindNames[1];
        case ObstacleKind::Airfoil:
            return kKindNames[2];
        }
        return "unknown";
    }

} // namespace pflow
