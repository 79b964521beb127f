// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file mesh_types.hpp
 * @brief Shared mesh types: formats, statistics and stage errors
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>

#include <vtkPolyData.h>
#include <vtkSmartPointer.h>

namespace dicom_mesher::services {

using MeshPointer = vtkSmartPointer<vtkPolyData>;

/**
 * @brief Mesh finishing stages, in execution order
 */
enum class MeshStage {
    Extract,
    Clean,
    Smooth,
    Decimate,
    Rotate,
    Write,
    Read
};

[[nodiscard]] inline const char* toString(MeshStage stage) noexcept {
    switch (stage) {
        case MeshStage::Extract: return "extract";
        case MeshStage::Clean: return "clean";
        case MeshStage::Smooth: return "smooth";
        case MeshStage::Decimate: return "decimate";
        case MeshStage::Rotate: return "rotate";
        case MeshStage::Write: return "write";
        case MeshStage::Read: return "read";
    }
    return "unknown";
}

/**
 * @brief Error raised by a mesh stage
 */
struct MeshStageError {
    MeshStage stage = MeshStage::Extract;
    std::string message;

    [[nodiscard]] std::string toString() const {
        return std::string("Mesh stage '") + services::toString(stage) + "' failed: " + message;
    }
};

/**
 * @brief Mesh file formats, selected from the output extension
 */
enum class MeshFormat {
    STL,    ///< STereoLithography format
    PLY,    ///< Polygon File Format
    OBJ,    ///< Wavefront OBJ format
    VTK     ///< Legacy VTK polydata
};

/**
 * @brief STL file format options
 */
enum class STLFormat {
    Binary,     ///< Binary format (smaller file size)
    ASCII       ///< ASCII format (human-readable)
};

/**
 * @brief Rotation applied to the finished mesh about the coordinate origin
 */
struct MeshRotation {
    int axis = 1;               ///< 0 = X, 1 = Y, 2 = Z
    double angleDegrees = 180.0;

    [[nodiscard]] bool isValid() const noexcept {
        return axis >= 0 && axis <= 2;
    }

    bool operator==(const MeshRotation&) const = default;
};

/**
 * @brief Statistics for a finished mesh
 */
struct MeshStatistics {
    size_t vertexCount = 0;                 ///< Number of vertices
    size_t triangleCount = 0;               ///< Number of triangles
    double surfaceAreaMm2 = 0.0;            ///< Surface area in mm^2
    double volumeMm3 = 0.0;                 ///< Enclosed volume in mm^3
    std::array<double, 6> boundingBox{};    ///< [xmin, xmax, ymin, ymax, zmin, zmax]
};

}  // namespace dicom_mesher::services
