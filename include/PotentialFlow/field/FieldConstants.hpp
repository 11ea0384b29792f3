// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <cstddef>

#include "PotentialFlow/common/Types.hpp"

namespace pflow
{

    namespace field
    {
        // characteristic length of every obstacle; fixed across the system
        constexpr real kObstacleRadius = 1.0;

        constexpr real kPi = 3.14159265358979323846;

        // cylinder: out-of-plane drift proportional to the local Bernoulli pressure
        constexpr real kCylinderPressureDrift = 0.01;
        // airfoil: out-of-plane scaling of the in-plane kinetic energy
        constexpr real kAirfoilSpanwiseScale = 0.1;

        // points handled per block by the batch kernel
        constexpr int kBatchBlockSize = 256;

    } // namespace field

    namespace flow
    {
        constexpr real kTimeStep = 0.01;

        // first-order low-pass on the particle velocity
        constexpr real kVelocityRetention = 0.95;
        constexpr real kVelocityBlend = 1.0 - kVelocityRetention;

        // lateral re-seed spread, as a fraction of the tunnel cross-section
        constexpr real kRecycleSpread = 0.8;

    } // namespace flow

} // namespace pflow
