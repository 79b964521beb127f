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

#include "services/preprocessing/volume_preprocessor.hpp"

#include <chrono>
#include <string>

#include "core/logging.hpp"

namespace dicom_mesher::services {

class VolumePreprocessor::Impl {
public:
    std::shared_ptr<const IVolumeFilters> filters;
    StageCallback stageCallback;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(std::shared_ptr<const IVolumeFilters> f)
        : filters(std::move(f))
        , logger(logging::LoggerFactory::create("VolumePreprocessor")) {}

    template <typename Operation>
    std::expected<VolumeType::Pointer, PreprocessingError>
    runStage(std::string_view stage, Operation&& operation) const
    {
        if (stageCallback) {
            stageCallback(stage);
        }

        const auto start = std::chrono::steady_clock::now();
        auto result = operation();
        const double seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();

        if (!result) {
            auto error = result.error();
            error.stage = std::string(stage);
            logger->error("Stage {} failed: {}", stage, error.message);
            return std::unexpected(std::move(error));
        }
        if (!result.value()) {
            return std::unexpected(PreprocessingError{
                PreprocessingError::Code::InternalError,
                "Stage produced no volume",
                std::string(stage)
            });
        }

        logger->debug("Stage {} done in {:.2f}s", stage, seconds);
        return result;
    }
};

VolumePreprocessor::VolumePreprocessor()
    : VolumePreprocessor(std::make_shared<ItkVolumeFilters>()) {}

VolumePreprocessor::VolumePreprocessor(std::shared_ptr<const IVolumeFilters> filters)
    : impl_(std::make_unique<Impl>(std::move(filters))) {}

VolumePreprocessor::~VolumePreprocessor() = default;

VolumePreprocessor::VolumePreprocessor(VolumePreprocessor&&) noexcept = default;
VolumePreprocessor& VolumePreprocessor::operator=(VolumePreprocessor&&) noexcept = default;

void VolumePreprocessor::setStageCallback(StageCallback callback)
{
    impl_->stageCallback = std::move(callback);
}

std::expected<VolumeType::Pointer, PreprocessingError>
VolumePreprocessor::preprocess(VolumeType::Pointer volume, const PreprocessOptions& options) const
{
    if (!volume) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput, "Input volume is null", "input"});
    }
    const auto size = volume->GetLargestPossibleRegion().GetSize();
    if (size[0] == 0 || size[1] == 0 || size[2] == 0) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput, "Input volume is empty", "input"});
    }
    if (options.tissue && !options.tissue->isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Tissue '" + options.tissue->name + "' has an empty threshold band",
            std::string(preprocess_stage::DoubleThreshold)});
    }

    const auto& filters = *impl_->filters;
    VolumeType::Pointer current = volume;

    if (options.shrinkEnabled) {
        VolumeShrinker::Parameters params;
        params.maxDimension = options.shrinkMaxDimension;
        auto result = impl_->runStage(preprocess_stage::Shrink,
            [&] { return filters.shrink(current, params); });
        if (!result) return std::unexpected(result.error());
        current = result.value();
    }

    if (options.smoothingEnabled) {
        auto result = impl_->runStage(preprocess_stage::AnisotropicSmoothing,
            [&] { return filters.smooth(current, options.smoothing); });
        if (!result) return std::unexpected(result.error());
        current = result.value();
    }

    if (options.tissue) {
        const auto params = DoubleThresholdFilter::Parameters::fromTissue(*options.tissue);
        auto result = impl_->runStage(preprocess_stage::DoubleThreshold,
            [&] { return filters.doubleThreshold(current, params); });
        if (!result) return std::unexpected(result.error());
        current = result.value();

        if (options.medianEnabled) {
            MedianFilter::Parameters medianParams;
            medianParams.radius = options.medianRadius;
            auto medianResult = impl_->runStage(preprocess_stage::Median,
                [&] { return filters.median(current, medianParams); });
            if (!medianResult) return std::unexpected(medianResult.error());
            current = medianResult.value();
        }
    }

    VolumePadder::Parameters padParams;
    padParams.voxels = options.padVoxels;
    padParams.value = options.padValue;
    auto padded = impl_->runStage(preprocess_stage::Pad,
        [&] { return filters.pad(current, padParams); });
    if (!padded) return std::unexpected(padded.error());

    return padded.value();
}

}  // namespace dicom_mesher::services
