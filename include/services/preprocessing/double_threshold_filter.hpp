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

#include <itkImage.h>
#include <itkSmartPointer.h>

#include "services/preprocessing/preprocessing_error.hpp"
#include "services/preprocessing/tissue_table.hpp"

namespace dicom_mesher::services {

/**
 * @brief Hysteresis-style binary segmentation of one tissue class
 *
 * Wraps itk::DoubleThresholdImageFilter. Voxels in the inner band seed
 * the object, which is then grown by geodesic dilation through voxels in
 * the outer band. The result is binary: @c insideValue on the object and
 * @c outsideValue elsewhere, with geometry identical to the input.
 */
class DoubleThresholdFilter {
public:
    using ImageType = VolumeType;

    struct Parameters {
        double threshold1 = 0.0;  ///< outer low
        double threshold2 = 0.0;  ///< inner low
        double threshold3 = 0.0;  ///< inner high
        double threshold4 = 0.0;  ///< outer high
        short insideValue = 255;
        short outsideValue = 0;
        bool fullyConnected = false;

        [[nodiscard]] bool isValid() const noexcept {
            return threshold1 <= threshold2 && threshold2 <= threshold3 &&
                   threshold3 <= threshold4 && threshold1 < threshold4;
        }

        [[nodiscard]] static Parameters fromTissue(const TissueConfig& tissue) noexcept {
            Parameters params;
            params.threshold1 = tissue.lowThreshold;
            params.threshold2 = tissue.innerLowThreshold;
            params.threshold3 = tissue.innerHighThreshold;
            params.threshold4 = tissue.highThreshold;
            return params;
        }
    };

    [[nodiscard]] std::expected<ImageType::Pointer, PreprocessingError>
    apply(ImageType::Pointer input, const Parameters& params) const;
};

}  // namespace dicom_mesher::services
