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

#include <array>
#include <expected>

#include <itkImage.h>
#include <itkSmartPointer.h>

#include "services/preprocessing/preprocessing_error.hpp"

namespace dicom_mesher::services {

/**
 * @brief Integer-factor downsampling of oversized volumes
 *
 * Keeps the volume extent at or below a maximum dimension by subsampling
 * every axis with the same integer factor
 * `f = ceil(maxExtent / maxDimension)`. Physical placement is preserved:
 * output spacing is `f` times the input spacing and the origin is moved to
 * the centre of the first output voxel.
 *
 * @example
 * @code
 * VolumeShrinker shrinker;
 * VolumeShrinker::Parameters params;
 * params.maxDimension = 256;
 *
 * // 512x512x300 at 0.5 mm becomes 256x256x150 at 1.0 mm
 * auto result = shrinker.shrink(ctVolume, params);
 * @endcode
 */
class VolumeShrinker {
public:
    using ImageType = VolumeType;

    struct Parameters {
        /// Largest extent allowed along any axis after shrinking
        unsigned int maxDimension = 256;

        [[nodiscard]] bool isValid() const noexcept {
            return maxDimension >= 1;
        }
    };

    /**
     * @brief Shrink factor for a volume of the given size
     * @return 1 when the volume already fits
     */
    [[nodiscard]] static unsigned int computeShrinkFactor(
        const std::array<unsigned int, 3>& size,
        unsigned int maxDimension) noexcept;

    /**
     * @brief Downsample @p input if any axis exceeds the maximum dimension
     *
     * When no shrinking is needed the input pointer is returned unchanged.
     */
    [[nodiscard]] std::expected<ImageType::Pointer, PreprocessingError>
    shrink(ImageType::Pointer input, const Parameters& params = {}) const;
};

}  // namespace dicom_mesher::services
