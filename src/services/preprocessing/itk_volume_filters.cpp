#include "services/preprocessing/i_volume_filters.hpp"

namespace dicom_mesher::services {

std::expected<IVolumeFilters::VolumePointer, PreprocessingError>
ItkVolumeFilters::shrink(VolumePointer volume, const VolumeShrinker::Parameters& params) const
{
    return VolumeShrinker{}.shrink(volume, params);
}

std::expected<IVolumeFilters::VolumePointer, PreprocessingError>
ItkVolumeFilters::smooth(VolumePointer volume,
                         const AnisotropicDiffusionFilter::Parameters& params) const
{
    return AnisotropicDiffusionFilter{}.apply(volume, params);
}

std::expected<IVolumeFilters::VolumePointer, PreprocessingError>
ItkVolumeFilters::doubleThreshold(VolumePointer volume,
                                  const DoubleThresholdFilter::Parameters& params) const
{
    return DoubleThresholdFilter{}.apply(volume, params);
}

std::expected<IVolumeFilters::VolumePointer, PreprocessingError>
ItkVolumeFilters::median(VolumePointer volume, const MedianFilter::Parameters& params) const
{
    return MedianFilter{}.apply(volume, params);
}

std::expected<IVolumeFilters::VolumePointer, PreprocessingError>
ItkVolumeFilters::pad(VolumePointer volume, const VolumePadder::Parameters& params) const
{
    return VolumePadder{}.apply(volume, params);
}

}  // namespace dicom_mesher::services
