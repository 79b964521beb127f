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

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "services/mesh/mesh_types.hpp"

namespace dicom_mesher::services {

/// Format for a file extension (.stl, .ply, .obj, .vtk; case-insensitive)
[[nodiscard]] std::optional<MeshFormat> detectFormat(const std::filesystem::path& path);

/// Canonical extension with leading dot
[[nodiscard]] std::string getFileExtension(MeshFormat format);

/**
 * @brief Read a mesh file; the format comes from the extension
 */
[[nodiscard]] std::expected<MeshPointer, MeshStageError>
readMesh(const std::filesystem::path& path);

/**
 * @brief Write a mesh without leaving a partial file behind
 *
 * The mesh is written to a temporary sibling and renamed onto @p path
 * once the writer succeeds. The format comes from the extension of @p path.
 */
[[nodiscard]] std::expected<void, MeshStageError>
writeMesh(const MeshPointer& mesh,
          const std::filesystem::path& path,
          STLFormat stlFormat = STLFormat::Binary);

/// Counts, area, volume and bounds of a mesh; zeros for an empty mesh
[[nodiscard]] MeshStatistics computeStatistics(const MeshPointer& mesh);

}  // namespace dicom_mesher::services
