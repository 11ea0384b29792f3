// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <cstddef>
#include <type_traits>
#include <vector>

#include <Eigen/Core>

#include <glm/glm.hpp>

namespace pflow
{
    using real = double; // float or double.

    using vec3_t = std::conditional_t<std::is_same_v<real, double>, glm::dvec3, glm::fvec3>;

    // interleaved [x0,y0,z0,x1,y1,z1,...] buffers shared with the host renderer
    using FlatBuffer = std::vector<float>;

    using Matrix3Xf = Eigen::Matrix<float, 3, Eigen::Dynamic>;
    using Matrix3XfMap = Eigen::Map<Matrix3Xf>;
    using ConstMatrix3XfMap = Eigen::Map<const Matrix3Xf>;
    using VectorXfMap = Eigen::Map<Eigen::VectorXf>;

    /**
     * @brief read the i-th 3-vector of an interleaved buffer.
     */
    inline vec3_t loadVec3(const float *data, std::size_t i)
    {
        return vec3_t(data[i * 3 + 0], data[i * 3 + 1], data[i * 3 + 2]);
    }

    /**
     * @brief write the i-th 3-vector of an interleaved buffer (narrowed to float).
     */
    inline void storeVec3(float *data, std::size_t i, const vec3_t &v)
    {
        data[i * 3 + 0] = static_cast<float>(v.x);
        data[i * 3 + 1] = static_cast<float>(v.y);
        data[i * 3 + 2] = static_cast<float>(v.z);
    }

} // namespace pflow
