// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <cmath>

#include <nlohmann/json.hpp>

#include "PotentialFlow/common/Types.hpp"

namespace pflow
{

    namespace flow
    {

        // Axis-aligned wind tunnel; flow enters at entry_x and leaves at exit_x.
        struct Tunnel
        {
            real entry_x = -10.0;
            real exit_x = 10.0;
            real width = 8.0;  // along y
            real height = 8.0; // along z

            real length() const { return exit_x - entry_x; }
            real halfWidth() const { return 0.5 * width; }
            real halfHeight() const { return 0.5 * height; }

            bool isValid() const { return entry_x < exit_x && width > 0.0 && height > 0.0; }

            bool exitedAxially(const vec3_t &p) const { return p.x > exit_x; }
            bool exitedLaterally(const vec3_t &p) const
            {
                return std::abs(p.y) > halfWidth() || std::abs(p.z) > halfHeight();
            }
        };

        inline void from_json(const nlohmann::json &j, Tunnel &tunnel)
        {
            tunnel.entry_x = j.value("entry_x", tunnel.entry_x);
            tunnel.exit_x = j.value("exit_x", tunnel.exit_x);
            tunnel.width = j.value("width", tunnel.width);
            tunnel.height = j.value("height", tunnel.height);
        }

        inline void to_json(nlohmann::json &j, const Tunnel &tunnel)
        {
            j = nlohmann::json{
                {"entry_x", tunnel.entry_x},
                {"exit_x", tunnel.exit_x},
                {"width", tunnel.width},
                {"height", tunnel.height}};
        }

    } // namespace flow

} // namespace pflow
