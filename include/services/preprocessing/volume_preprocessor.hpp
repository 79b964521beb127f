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
 * @file volume_preprocessor.hpp
 * @brief Fixed-order preprocessing chain ahead of surface extraction
 * @details Runs, in this order and each only when enabled:
 *          shrink, anisotropic smoothing, double threshold, median, pad.
 *          The first failing stage aborts the chain; its name is carried
 *          in PreprocessingError::stage and no partial volume is returned.
 */

#pragma once

#include <array>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "services/preprocessing/i_volume_filters.hpp"
#include "services/preprocessing/tissue_table.hpp"

namespace dicom_mesher::services {

/// Preprocessing stage names, in execution order
namespace preprocess_stage {
inline constexpr std::string_view Shrink = "shrink";
inline constexpr std::string_view AnisotropicSmoothing = "anisotropic_smoothing";
inline constexpr std::string_view DoubleThreshold = "double_threshold";
inline constexpr std::string_view Median = "median";
inline constexpr std::string_view Pad = "pad";
}  // namespace preprocess_stage

/**
 * @brief Resolved preprocessing switches for one run
 */
struct PreprocessOptions {
    bool shrinkEnabled = true;
    unsigned int shrinkMaxDimension = 256;

    bool smoothingEnabled = false;
    AnisotropicDiffusionFilter::Parameters smoothing;

    /// Double threshold runs only when a tissue is set
    std::optional<TissueConfig> tissue;

    /// Median runs only on a thresholded volume; defaults to tissue.useMedian
    bool medianEnabled = false;
    std::array<unsigned int, 3> medianRadius = {1, 1, 0};

    unsigned int padVoxels = 5;
    short padValue = 0;
};

/**
 * @brief Orchestrates the preprocessing filters in their fixed order
 *
 * @example
 * @code
 * VolumePreprocessor preprocessor;
 * PreprocessOptions options;
 * options.tissue = TissueTable::lookup("bone").value();
 * auto prepared = preprocessor.preprocess(ctVolume, options);
 * if (!prepared) {
 *     spdlog::error(prepared.error().toString());
 * }
 * @endcode
 */
class VolumePreprocessor {
public:
    /// Called before each stage that runs
    using StageCallback = std::function<void(std::string_view stage)>;

    /// Uses ItkVolumeFilters
    VolumePreprocessor();
    explicit VolumePreprocessor(std::shared_ptr<const IVolumeFilters> filters);
    ~VolumePreprocessor();

    // Non-copyable, movable
    VolumePreprocessor(const VolumePreprocessor&) = delete;
    VolumePreprocessor& operator=(const VolumePreprocessor&) = delete;
    VolumePreprocessor(VolumePreprocessor&&) noexcept;
    VolumePreprocessor& operator=(VolumePreprocessor&&) noexcept;

    void setStageCallback(StageCallback callback);

    /**
     * @brief Run the enabled stages on @p volume
     *
     * @param volume Non-null, non-empty 3-D volume; it is not modified
     * @param options Stage switches and parameters
     * @return New volume, or the error of the first failing stage
     */
    [[nodiscard]] std::expected<VolumeType::Pointer, PreprocessingError>
    preprocess(VolumeType::Pointer volume, const PreprocessOptions& options) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_mesher::services
