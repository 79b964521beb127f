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

#include "services/preprocessing/preprocessing_error.hpp"

namespace dicom_mesher::services {

/**
 * @brief Curvature anisotropic diffusion of a CT volume before thresholding
 *
 * Diffuses a float copy of the volume and casts it back to short. Flat
 * regions lose their noise while bone/soft-tissue edges stay in place, so a
 * later double threshold does not break the skull into speckle. Geometry
 * (spacing, origin, direction) is carried over unchanged.
 */
class AnisotropicDiffusionFilter {
public:
    using InternalImageType = itk::Image<float, 3>;
    using ImageType = VolumeType;

    struct Parameters {
        /// 1 to 50
        int numberOfIterations = 5;

        /// Edge sensitivity, 0.5 to 10
        double conductance = 3.0;

        /// Must stay at or below 1/8 in 3-D; 0 picks 0.0625
        double timeStep = 0.03;

        bool useImageSpacing = true;

        [[nodiscard]] bool isValid() const noexcept {
            return numberOfIterations >= 1 && numberOfIterations <= 50 &&
                   conductance >= 0.5 && conductance <= 10.0 &&
                   timeStep >= 0.0 && timeStep <= 0.125;
        }

        [[nodiscard]] double effectiveTimeStep() const noexcept {
            return timeStep > 0.0 ? timeStep : 0.0625;
        }

        bool operator==(const Parameters&) const = default;
    };

    /// @return A new volume; @p input is not modified
    [[nodiscard]] std::expected<ImageType::Pointer, PreprocessingError>
    apply(ImageType::Pointer input, const Parameters& params = {}) const;
};

}  // namespace dicom_mesher::services
