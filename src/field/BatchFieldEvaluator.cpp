// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/field/BatchFieldEvaluator.hpp"
#include "PotentialFlow/utils/Logger.hpp"

#include <algorithm>

namespace pflow
{

    namespace field
    {

        namespace
        {
            using BlockArray = Eigen::Array<real, Eigen::Dynamic, 1, Eigen::ColMajor, kBatchBlockSize, 1>;
            using BlockMask = Eigen::Array<bool, Eigen::Dynamic, 1, Eigen::ColMajor, kBatchBlockSize, 1>;

            struct BlockVelocity
            {
                BlockArray vx, vy, vz;
            };

            void sphereBlock(const BlockArray &x, const BlockArray &y, const BlockArray &z,
                             const BlockArray &r2, const BlockArray &r, real R, real U,
                             BlockVelocity &v)
            {
                const BlockArray factor = (R * R * R) / (r2 * r);
                const BlockArray denom = 2.0 * r2;
                v.vx = U * (1.0 - factor * (3.0 * x.square() / denom - 0.5));
                v.vy = U * (-factor * 3.0 * x * y / denom);
                v.vz = U * (-factor * 3.0 * x * z / denom);
            }

            void cylinderBlock(const BlockArray &x, const BlockArray &y, const BlockArray &z,
                               const BlockArray &rxy2, real R, real U, real rho,
                               BlockVelocity &v)
            {
                const BlockArray factor = (R * R) / rxy2;
                v.vx = U * (1.0 - factor * (2.0 * x.square() / rxy2 - 1.0));
                v.vy = U * (-factor * 2.0 * x * y / rxy2);

                const BlockArray pressure = rho * (0.5 * U * U - 0.5 * (v.vx.square() + v.vy.square()));
                v.vz = z * pressure * kCylinderPressureDrift;
            }

            void airfoilBlock(const BlockArray &x, const BlockArray &y, const BlockArray &z,
                              const BlockArray &rxy2, const BlockArray &rxy, real R, real U,
                              BlockVelocity &v)
            {
                // cos(2a), sin(2a) and sin(a) of a = atan2(y, x)
                const BlockArray cos2a = (x.square() - y.square()) / rxy2;
                const BlockArray sin2a = 2.0 * x * y / rxy2;
                const BlockArray sina = y / rxy;

                const BlockArray factor = (R * R) / rxy2;
                const BlockArray circulation = U * 4.0 * kPi * R * sina;

                v.vx = U * (1.0 - factor * cos2a);
                v.vy = U * (-factor * sin2a) + circulation / (2.0 * kPi * rxy);
                if (U == 0.0)
                {
                    v.vz.setZero(x.size());
                }
                else
                {
                    v.vz = kAirfoilSpanwiseScale * z * (v.vx.square() + v.vy.square()) / (R * U);
                }
            }

            void throwNonFinite(const BlockVelocity &v, const BlockMask &finite_input, std::size_t start)
            {
                const BlockMask bad = finite_input && !(v.vx.isFinite() && v.vy.isFinite() && v.vz.isFinite());
                for (Eigen::Index k = 0; k < bad.size(); ++k)
                {
                    if (bad(k))
                    {
                        throw EvaluatorError(fmt::format(
                            "Batch kernel produced a non-finite velocity [{}, {}, {}] for particle {}.",
                            v.vx(k), v.vy(k), v.vz(k), start + static_cast<std::size_t>(k)));
                    }
                }
            }
        } // namespace

        void BatchFieldEvaluator::doEvaluate(const float *positions, std::size_t count,
                                             const FlowParameters &flow, const ObstacleDescriptor &obstacle,
                                             float *velocities) const
        {
            const Eigen::Index n_total = static_cast<Eigen::Index>(count);
            ConstMatrix3XfMap pos(positions, 3, n_total);
            Matrix3XfMap out(velocities, 3, n_total);

            const real R = obstacle.radius;
            const real U = flow.free_stream_velocity;
            const real rho = flow.fluid_density;

            BlockArray x, y, z, r2, r, rxy2, rxy;
            BlockMask active;
            BlockVelocity v;

            for (Eigen::Index start = 0; start < n_total; start += static_cast<Eigen::Index>(kBatchBlockSize))
            {
                const Eigen::Index n = std::min<Eigen::Index>(kBatchBlockSize, n_total - start);

                x = pos.row(0).segment(start, n).transpose().cast<real>().array() - obstacle.position.x;
                y = pos.row(1).segment(start, n).transpose().cast<real>().array() - obstacle.position.y;
                z = pos.row(2).segment(start, n).transpose().cast<real>().array() - obstacle.position.z;

                rxy2 = x.square() + y.square();
                r2 = rxy2 + z.square();
                r = r2.sqrt();
                rxy = rxy2.sqrt();

                // masked-out lanes may hold inf/nan, select() discards them
                switch (obstacle.kind)
                {
                case ObstacleKind::Sphere:
                    active = r > R;
                    sphereBlock(x, y, z, r2, r, R, U, v);
                    break;
                case ObstacleKind::Cylinder:
                    active = (r > R) && (rxy > R);
                    cylinderBlock(x, y, z, rxy2, R, U, rho, v);
                    break;
                case ObstacleKind::Airfoil:
                    active = (r > R) && (rxy > R);
                    airfoilBlock(x, y, z, rxy2, rxy, R, U, v);
                    break;
                default:
                    // unknown kind: undisturbed free stream outside the radius
                    active = r > R;
                    v.vx = BlockArray::Constant(n, U);
                    v.vy = BlockArray::Zero(n);
                    v.vz = BlockArray::Zero(n);
                    break;
                }

                v.vx = active.select(v.vx, 0.0);
                v.vy = active.select(v.vy, 0.0);
                v.vz = active.select(v.vz, 0.0);

                if (m_validate_output)
                {
                    const BlockMask finite_input = x.isFinite() && y.isFinite() && z.isFinite();
                    throwNonFinite(v, finite_input, static_cast<std::size_t>(start));
                }

                out.row(0).segment(start, n) = v.vx.cast<float>().matrix().transpose();
                out.row(1).segment(start, n) = v.vy.cast<float>().matrix().transpose();
                out.row(2).segment(start, n) = v.vz.cast<float>().matrix().transpose();
            }
        }

        void BatchFieldEvaluator::doEvaluatePressure(const float *velocities, std::size_t count,
                                                     real free_stream_velocity, real fluid_density,
                                                     float *pressures) const
        {
            const Eigen::Index n_total = static_cast<Eigen::Index>(count);
            ConstMatrix3XfMap vel(velocities, 3, n_total);
            VectorXfMap out(pressures, n_total);

            const real p_ref = 0.5 * fluid_density * free_stream_velocity * free_stream_velocity;

            BlockArray v2;
            for (Eigen::Index start = 0; start < n_total; start += static_cast<Eigen::Index>(kBatchBlockSize))
            {
                const Eigen::Index n = std::min<Eigen::Index>(kBatchBlockSize, n_total - start);

                v2 = vel.middleCols(start, n).cast<real>().colwise().squaredNorm().transpose().array();
                out.segment(start, n) = (p_ref - 0.5 * fluid_density * v2).cast<float>().matrix();
            }
        }

    } // namespace field

} // namespace pflow
