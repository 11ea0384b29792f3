// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "PotentialFlow/utils/DataStructures.hpp"
#include "PotentialFlow/utils/Logger.hpp"

#include <vtkSmartPointer.h>
#include <vtkImageData.h>
#include <vtkUnstructuredGrid.h>
#include <vtkPoints.h>
#include <vtkFloatArray.h>
#include <vtkPointData.h>
#include <vtkCellType.h>
#include <vtkXMLImageDataWriter.h>
#include <vtkXMLUnstructuredGridWriter.h>

namespace pflow
{

    namespace io
    {

        class VtkWriter
        {
        public:
            // --- sample planes (Structured Data -> vtkImageData) ---

            // every array holds nx * ny * nz tuples in VTK order (x fastest)
            static bool writeImageData(
                const std::string &filepath,
                int nx, int ny, int nz,
                const glm::dvec3 &spacing,
                const glm::dvec3 &origin,
                const std::vector<PointArrayView> &point_arrays)
            {
                LOG_DEBUG("Writing VTK ImageData to: {}", filepath);

                auto imageData = vtkSmartPointer<vtkImageData>::New();
                imageData->SetDimensions(nx, ny, nz);
                imageData->SetSpacing(spacing.x, spacing.y, spacing.z);
                imageData->SetOrigin(origin.x, origin.y, origin.z);

                const std::size_t num_points = static_cast<std::size_t>(nx) * ny * nz;
                attachPointArrays(imageData->GetPointData(), num_points, point_arrays);

                auto writer = vtkSmartPointer<vtkXMLImageDataWriter>::New();
                writer->SetFileName(filepath.c_str());
                writer->SetInputData(imageData);
                writer->SetDataModeToAppended(); // using compression mode, file is smaller
                writer->EncodeAppendedDataOn();
                return finish(writer->Write(), filepath);
            }

            // --- particles and polylines (vtkUnstructuredGrid) ---

            template <typename T>
            static bool writeUnstructuredGrid(
                const std::string &filepath,
                const std::vector<glm::vec<3, T>> &vertices,
                const std::vector<std::pair<VtkCellType, std::vector<uint32_t>>> &elements_groups,
                const std::vector<PointArrayView> &point_arrays = {})
            {
                LOG_DEBUG("Writing VTK UnstructuredGrid to: {}", filepath);

                auto points = vtkSmartPointer<vtkPoints>::New();
                points->SetDataType(std::is_same_v<T, float> ? VTK_FLOAT : VTK_DOUBLE);
                points->SetNumberOfPoints(static_cast<vtkIdType>(vertices.size()));
                for (std::size_t i = 0; i < vertices.size(); ++i)
                {
                    points->SetPoint(static_cast<vtkIdType>(i), static_cast<double>(vertices[i].x),
                                     static_cast<double>(vertices[i].y), static_cast<double>(vertices[i].z));
                }

                auto uGrid = vtkSmartPointer<vtkUnstructuredGrid>::New();
                uGrid->SetPoints(points);

                for (const auto &group : elements_groups)
                {
                    const VtkCellType cell_type = group.first;
                    const auto &connectivity = group.second;

                    int verts_per_cell = 0;
                    VTKCellType vtk_enum_type;

                    switch (cell_type)
                    {
                    case VtkCellType::Vertex:
                        verts_per_cell = 1;
                        vtk_enum_type = VTK_VERTEX;
                        break;
                    case VtkCellType::Line:
                        verts_per_cell = 2;
                        vtk_enum_type = VTK_LINE;
                        break;
                    default:
                        LOG_WARN("Unsupported VtkCellType encountered in VtkWriter. Skipping.");
                        continue;
                    }

                    if (connectivity.empty())
                    {
                        continue;
                    }
                    ASSERT(connectivity.size() % verts_per_cell == 0, "Element connectivity data size is not a multiple of verts_per_cell.");

                    const std::size_t num_cells_in_group = connectivity.size() / verts_per_cell;

                    std::vector<vtkIdType> ptIds(verts_per_cell);
                    for (std::size_t i = 0; i < num_cells_in_group; ++i)
                    {
                        for (int j = 0; j < verts_per_cell; ++j)
                        {
                            ptIds[j] = static_cast<vtkIdType>(connectivity[i * verts_per_cell + j]);
                        }
                        uGrid->InsertNextCell(vtk_enum_type, verts_per_cell, ptIds.data());
                    }
                }

                attachPointArrays(uGrid->GetPointData(), vertices.size(), point_arrays);

                auto writer = vtkSmartPointer<vtkXMLUnstructuredGridWriter>::New();
                writer->SetFileName(filepath.c_str());
                writer->SetInputData(uGrid);
                writer->SetDataModeToAppended();
                writer->EncodeAppendedDataOn();
                return finish(writer->Write(), filepath);
            }

        private:
            static void attachPointArrays(vtkPointData *point_data, std::size_t num_tuples,
                                          const std::vector<PointArrayView> &point_arrays)
            {
                for (const auto &view : point_arrays)
                {
                    if (view.data == nullptr || num_tuples == 0)
                    {
                        continue;
                    }
                    point_data->AddArray(createVtkDataArray(view.data, num_tuples, view.components, view.name));
                }
            }

            static vtkSmartPointer<vtkFloatArray> createVtkDataArray(
                const float *data, std::size_t num_tuples, int num_components, const std::string &name)
            {
                auto vtk_array = vtkSmartPointer<vtkFloatArray>::New();
                vtk_array->SetNumberOfComponents(num_components);
                vtk_array->SetNumberOfTuples(static_cast<vtkIdType>(num_tuples));
                vtk_array->SetName(name.c_str());
                std::copy(data, data + num_tuples * num_components, vtk_array->GetPointer(0));
                return vtk_array;
            }

            static bool finish(int write_status, const std::string &filepath)
            {
                if (write_status == 0)
                {
                    LOG_ERROR("VTK writer failed for '{}'.", filepath);
                    return false;
                }
                return true;
            }
        };

    } // namespace io

} // namespace pflow
