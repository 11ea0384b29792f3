// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <cstddef>
#include <string>

namespace pflow
{
    // values match VTKCellType
    enum class VtkCellType : unsigned char
    {
        Vertex = 1,
        Line = 3,
    };

    // non-owning view of an interleaved per-point array handed to the writers
    struct PointArrayView
    {
        std::string name;
        const float *data = nullptr;
        int components = 1;
    };

} // namespace pflow
