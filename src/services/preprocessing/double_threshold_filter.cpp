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

#include "services/preprocessing/double_threshold_filter.hpp"

#include <algorithm>
#include <limits>

#include <itkDoubleThresholdImageFilter.h>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DoubleThreshold");
    return logger;
}

short clampToPixel(double value) {
    constexpr double lo = std::numeric_limits<short>::min();
    constexpr double hi = std::numeric_limits<short>::max();
    return static_cast<short>(std::clamp(value, lo, hi));
}

}  // anonymous namespace

std::expected<DoubleThresholdFilter::ImageType::Pointer, PreprocessingError>
DoubleThresholdFilter::apply(ImageType::Pointer input, const Parameters& params) const
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
            "Thresholds must satisfy t1 <= t2 <= t3 <= t4 and t1 < t4"
        });
    }

    try {
        using FilterType = itk::DoubleThresholdImageFilter<ImageType, ImageType>;
        auto filter = FilterType::New();
        filter->SetInput(input);
        filter->SetThreshold1(clampToPixel(params.threshold1));
        filter->SetThreshold2(clampToPixel(params.threshold2));
        filter->SetThreshold3(clampToPixel(params.threshold3));
        filter->SetThreshold4(clampToPixel(params.threshold4));
        filter->SetInsideValue(params.insideValue);
        filter->SetOutsideValue(params.outsideValue);
        filter->SetFullyConnected(params.fullyConnected);
        filter->Update();

        ImageType::Pointer output = filter->GetOutput();
        output->DisconnectPipeline();

        getLogger()->debug("Double threshold [{}, {}, {}, {}]",
                           params.threshold1, params.threshold2,
                           params.threshold3, params.threshold4);
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

}  // namespace dicom_mesher::services
