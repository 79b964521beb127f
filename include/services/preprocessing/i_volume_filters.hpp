#pragma once

#include <expected>

#include "services/preprocessing/anisotropic_diffusion_filter.hpp"
#include "services/preprocessing/double_threshold_filter.hpp"
#include "services/preprocessing/median_filter.hpp"
#include "services/preprocessing/preprocessing_error.hpp"
#include "services/preprocessing/volume_padder.hpp"
#include "services/preprocessing/volume_shrinker.hpp"

namespace dicom_mesher::services {

/**
 * @brief Volume filter capabilities used by VolumePreprocessor
 *
 * Each operation returns a new volume or an error and never modifies its
 * input. The preprocessor owns the stage order; implementations only run
 * the filter they are asked for.
 */
class IVolumeFilters {
public:
    using VolumePointer = VolumeType::Pointer;

    virtual ~IVolumeFilters() = default;

    [[nodiscard]] virtual std::expected<VolumePointer, PreprocessingError>
    shrink(VolumePointer volume, const VolumeShrinker::Parameters& params) const = 0;

    [[nodiscard]] virtual std::expected<VolumePointer, PreprocessingError>
    smooth(VolumePointer volume, const AnisotropicDiffusionFilter::Parameters& params) const = 0;

    [[nodiscard]] virtual std::expected<VolumePointer, PreprocessingError>
    doubleThreshold(VolumePointer volume, const DoubleThresholdFilter::Parameters& params) const = 0;

    [[nodiscard]] virtual std::expected<VolumePointer, PreprocessingError>
    median(VolumePointer volume, const MedianFilter::Parameters& params) const = 0;

    [[nodiscard]] virtual std::expected<VolumePointer, PreprocessingError>
    pad(VolumePointer volume, const VolumePadder::Parameters& params) const = 0;
};

/**
 * @brief IVolumeFilters backed by the ITK filter classes
 */
class ItkVolumeFilters : public IVolumeFilters {
public:
    [[nodiscard]] std::expected<VolumePointer, PreprocessingError>
    shrink(VolumePointer volume, const VolumeShrinker::Parameters& params) const override;

    [[nodiscard]] std::expected<VolumePointer, PreprocessingError>
    smooth(VolumePointer volume, const AnisotropicDiffusionFilter::Parameters& params) const override;

    [[nodiscard]] std::expected<VolumePointer, PreprocessingError>
    doubleThreshold(VolumePointer volume, const DoubleThresholdFilter::Parameters& params) const override;

    [[nodiscard]] std::expected<VolumePointer, PreprocessingError>
    median(VolumePointer volume, const MedianFilter::Parameters& params) const override;

    [[nodiscard]] std::expected<VolumePointer, PreprocessingError>
    pad(VolumePointer volume, const VolumePadder::Parameters& params) const override;
};

}  // namespace dicom_mesher::services
