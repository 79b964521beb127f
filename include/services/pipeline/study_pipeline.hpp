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
 * @file study_pipeline.hpp
 * @brief Conversion of one study into one mesh file
 * @details Resolves the input (DICOM directory, zip archive of DICOM
 *          slices, or a volume file), optionally checks that it is CT,
 *          then runs preprocessing, conversion and mesh finishing.
 */

#pragma once

#include <array>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "services/mesh/i_mesh_operations.hpp"
#include "services/pipeline/pipeline_config.hpp"
#include "services/pipeline_error.hpp"
#include "services/preprocessing/i_volume_filters.hpp"

namespace dicom_mesher::services {

enum class StudyInputKind {
    DicomDirectory,
    ZipArchive,
    VolumeFile
};

[[nodiscard]] const char* toString(StudyInputKind kind) noexcept;

/**
 * @brief Loaded study volume before preprocessing
 */
struct StudyVolume {
    VolumeType::Pointer volume;
    StudyInputKind kind = StudyInputKind::VolumeFile;
    std::string modality;       ///< Empty when the input carries none
    size_t sliceCount = 0;      ///< DICOM slices read, 0 for volume files
};

struct StudyResult {
    std::filesystem::path outputPath;
    StudyInputKind inputKind = StudyInputKind::VolumeFile;
    std::string modality;
    std::array<size_t, 3> inputSize = {0, 0, 0};
    std::array<double, 3> inputSpacing = {1.0, 1.0, 1.0};
    size_t triangleCount = 0;
    MeshStatistics statistics;
    std::optional<std::filesystem::path> volumeInfoPath;
};

class StudyPipeline {
public:
    /// Uses the ITK filters and VTK mesh operations
    StudyPipeline();
    StudyPipeline(std::shared_ptr<const IVolumeFilters> filters,
                  std::shared_ptr<const IMeshOperations> meshOperations);
    ~StudyPipeline();

    // Non-copyable, movable
    StudyPipeline(const StudyPipeline&) = delete;
    StudyPipeline& operator=(const StudyPipeline&) = delete;
    StudyPipeline(StudyPipeline&&) noexcept;
    StudyPipeline& operator=(StudyPipeline&&) noexcept;

    /**
     * @brief Convert @p input into the mesh file @p outputPath
     *
     * A directory is read as the DICOM series with the most slices; a zip
     * archive is extracted into a temporary directory that is removed again
     * before returning; any other file is read as a volume.
     */
    [[nodiscard]] std::expected<StudyResult, PipelineError>
    run(const std::filesystem::path& input,
        const std::filesystem::path& outputPath,
        const PipelineConfig& config) const;

    /// Resolve and read @p input without processing it
    [[nodiscard]] static std::expected<StudyVolume, PipelineError>
    loadStudy(const std::filesystem::path& input);

    /// `<dir>/<stem>.volume.txt` for @p meshPath
    [[nodiscard]] static std::filesystem::path
    volumeInfoPathFor(const std::filesystem::path& meshPath);

    /**
     * @brief Write the dimensions and spacing of @p volume
     *
     * Lines `xdimension`, `ydimension`, `zdimension`, `xspacing`,
     * `yspacing`, `zspacing`; spacing rounded to three decimals.
     */
    [[nodiscard]] static std::expected<void, PipelineError>
    writeVolumeInfo(const VolumeType* volume, const std::filesystem::path& path);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_mesher::services
