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

#include "services/preprocessing/volume_shrinker.hpp"

#include <algorithm>

#include <itkShrinkImageFilter.h>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("VolumeShrinker");
    return logger;
}

}  // anonymous namespace

unsigned int VolumeShrinker::computeShrinkFactor(
    const std::array<unsigned int, 3>& size,
    unsigned int maxDimension) noexcept
{
    if (maxDimension == 0) {
        return 1;
    }
    const unsigned int maxExtent = *std::max_element(size.begin(), size.end());
    const unsigned int factor = (maxExtent + maxDimension - 1) / maxDimension;
    return std::max(factor, 1u);
}

std::expected<VolumeShrinker::ImageType::Pointer, PreprocessingError>
VolumeShrinker::shrink(ImageType::Pointer input, const Parameters& params) const
{
    if (!input) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Input image is null"
        });
    }

    if (!params.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "maxDimension must be at least 1"
        });
    }

    const auto inputSize = input->GetLargestPossibleRegion().GetSize();
    const std::array<unsigned int, 3> size = {
        static_cast<unsigned int>(inputSize[0]),
        static_cast<unsigned int>(inputSize[1]),
        static_cast<unsigned int>(inputSize[2])
    };

    const unsigned int factor = computeShrinkFactor(size, params.maxDimension);
    if (factor == 1) {
        getLogger()->debug("Volume {}x{}x{} fits within {}, no shrink",
                           size[0], size[1], size[2], params.maxDimension);
        return input;
    }

    try {
        using ShrinkFilterType = itk::ShrinkImageFilter<ImageType, ImageType>;
        auto shrinkFilter = ShrinkFilterType::New();
        shrinkFilter->SetInput(input);
        shrinkFilter->SetShrinkFactors(factor);
        shrinkFilter->Update();

        ImageType::Pointer output = shrinkFilter->GetOutput();
        output->DisconnectPipeline();

        const auto outSize = output->GetLargestPossibleRegion().GetSize();
        getLogger()->info("Shrink factor {}: {}x{}x{} -> {}x{}x{}",
                          factor, size[0], size[1], size[2],
                          outSize[0], outSize[1], outSize[2]);
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

}  // namespace dicom_mesher::services
