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
 * @file mesh_finisher.hpp
 * @brief Surface extraction and mesh finishing
 * @details Turns a converted volume into a mesh file through the fixed
 *          sequence extract, clean, smooth, decimate, rotate, write.
 *          Smoothing and decimation are skipped when their amount is zero;
 *          rotation runs only when requested.
 */

#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "core/image_converter.hpp"
#include "services/mesh/i_mesh_operations.hpp"
#include "services/mesh/mesh_types.hpp"

namespace dicom_mesher::services {

/**
 * @brief Resolved mesh finishing options for one run
 */
struct MeshOptions {
    double isoValue = 0.0;                  ///< Marching cubes threshold
    int smoothingIterations = 25;           ///< Windowed-sinc iterations, 0 disables
    double smoothingPassBand = 0.1;         ///< Windowed-sinc pass band
    double decimationReduction = 0.9;       ///< Fraction of triangles removed, 0 disables
    std::optional<MeshRotation> rotation;   ///< Applied about the origin when set
    bool keepLargestRegion = false;         ///< Keep only the largest connected region when cleaning
    STLFormat stlFormat = STLFormat::Binary;

    [[nodiscard]] bool isValid() const noexcept {
        if (smoothingIterations < 0) return false;
        if (smoothingPassBand <= 0.0 || smoothingPassBand > 2.0) return false;
        if (decimationReduction < 0.0 || decimationReduction >= 1.0) return false;
        if (rotation && !rotation->isValid()) return false;
        return true;
    }
};

/**
 * @brief Result of a successful finish
 */
struct MeshFinishResult {
    std::filesystem::path outputPath;
    size_t extractedTriangles = 0;
    size_t cleanedTriangles = 0;
    MeshStatistics statistics;              ///< Of the written mesh
};

/**
 * @brief Runs the mesh finishing stages over an IMeshOperations backend
 *
 * @example
 * @code
 * MeshFinisher finisher;
 * MeshOptions options;
 * options.isoValue = 64.0;
 * options.rotation = MeshRotation{1, 180.0};
 * auto result = finisher.finish(meshInput, options, "/out/study.stl");
 * if (result) {
 *     logger->info("{} triangles", result->statistics.triangleCount);
 * }
 * @endcode
 */
class MeshFinisher {
public:
    using StageCallback = std::function<void(MeshStage stage)>;

    /// Uses VtkMeshOperations
    MeshFinisher();
    explicit MeshFinisher(std::shared_ptr<const IMeshOperations> operations);
    ~MeshFinisher();

    // Non-copyable, movable
    MeshFinisher(const MeshFinisher&) = delete;
    MeshFinisher& operator=(const MeshFinisher&) = delete;
    MeshFinisher(MeshFinisher&&) noexcept;
    MeshFinisher& operator=(MeshFinisher&&) noexcept;

    void setStageCallback(StageCallback callback);

    /**
     * @brief Extract, finish and write the surface of @p input
     *
     * No file exists at @p outputPath unless the whole sequence succeeded.
     * The written mesh never has more triangles than the cleaned mesh.
     */
    [[nodiscard]] std::expected<MeshFinishResult, MeshStageError>
    finish(const core::MeshInput& input,
           const MeshOptions& options,
           const std::filesystem::path& outputPath) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_mesher::services
