// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/field/ScalarFieldEvaluator.hpp"

#include <cmath>

namespace pflow
{

    namespace field
    {

        namespace
        {
            // 3D dipole
            vec3_t sphereVelocity(const vec3_t &p, real r, real radius, real U)
            {
                const real factor = std::pow(radius, 3) / std::pow(r, 3);
                const real r2 = r * r;
                return vec3_t(
                    U * (1.0 - factor * (3.0 * p.x * p.x / (2.0 * r2) - 0.5)),
                    U * (-factor * 3.0 * p.x * p.y / (2.0 * r2)),
                    U * (-factor * 3.0 * p.x * p.z / (2.0 * r2)));
            }

            // 2D doublet in the xy plane, z drifts with the local pressure
            vec3_t cylinderVelocity(const vec3_t &p, real radius, real U, real rho)
            {
                const real rxy = std::sqrt(p.x * p.x + p.y * p.y);
                if (rxy <= radius)
                {
                    return vec3_t(0.0);
                }

                const real factor = std::pow(radius / rxy, 2);
                const real rxy2 = rxy * rxy;
                vec3_t v(0.0);
                v.x = U * (1.0 - factor * (2.0 * p.x * p.x / rxy2 - 1.0));
                v.y = U * (-factor * 2.0 * p.x * p.y / rxy2);

                const real pressure = rho * (0.5 * U * U - 0.5 * (v.x * v.x + v.y * v.y));
                v.z += p.z * pressure * kCylinderPressureDrift;
                return v;
            }

            // doublet plus a bound vortex carrying the circulation
            vec3_t airfoilVelocity(const vec3_t &p, real radius, real U)
            {
                const real rxy = std::sqrt(p.x * p.x + p.y * p.y);
                const real angle = std::atan2(p.y, p.x);
                const real circulation = U * 4.0 * kPi * radius * std::sin(angle);

                if (rxy <= radius)
                {
                    return vec3_t(0.0);
                }

                const real factor = std::pow(radius / rxy, 2);
                vec3_t v(0.0);
                v.x = U * (1.0 - factor * std::cos(2.0 * angle));
                v.y = U * (-factor * std::sin(2.0 * angle)) + circulation / (2.0 * kPi * rxy);
                // the in-plane speed scales with U, so the term vanishes with a resting stream
                v.z = (U == 0.0) ? 0.0 : kAirfoilSpanwiseScale * p.z * (v.x * v.x + v.y * v.y) / (radius * U);
                return v;
            }
        } // namespace

        vec3_t evaluateVelocity(const vec3_t &rel, ObstacleKind kind, real radius,
                                real free_stream_velocity, real fluid_density)
        {
            const real r = glm::length(rel);
            if (r <= radius)
            {
                return vec3_t(0.0);
            }

            switch (kind)
            {
            case ObstacleKind::Sphere:
                return sphereVelocity(rel, r, radius, free_stream_velocity);
            case ObstacleKind::Cylinder:
                return cylinderVelocity(rel, radius, free_stream_velocity, fluid_density);
            case ObstacleKind::Airfoil:
                return airfoilVelocity(rel, radius, free_stream_velocity);
            }
            return vec3_t(free_stream_velocity, 0.0, 0.0);
        }

        real evaluatePressure(const vec3_t &velocity, real free_stream_velocity, real fluid_density)
        {
            const real p_ref = 0.5 * fluid_density * free_stream_velocity * free_stream_velocity;
            return p_ref - 0.5 * fluid_density * glm::dot(velocity, velocity);
        }

        void ScalarFieldEvaluator::doEvaluate(const float *positions, std::size_t count,
                                              const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                                              float *velocities) const
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                const vec3_t rel = loadVec3(positions, i) - obstacle.position;
                const vec3_t v = evaluateVelocity(rel, obstacle.kind, obstacle.radius,
                                                  flow.free_stream_velocity, flow.fluid_density);
                storeVec3(velocities, i, v);
            }
        }

        void ScalarFieldEvaluator::doEvaluatePressure(const float *velocities, std::size_t count,
                                                      real free_stream_velocity, real fluid_density,
                                                      float *pressures) const
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                pressures[i] = static_cast<float>(
                    field::evaluatePressure(loadVec3(velocities, i), free_stream_velocity, fluid_density));
            }
        }

    } // namespace field

} // namespace pflow
