#pragma once

#include <expected>

#include <itkImage.h>

#include "services/preprocessing/preprocessing_error.hpp"

namespace dicom_mesher::services {

/**
 * @brief Constant-value border so extracted surfaces close at the edges
 *
 * Adds @c voxels on both sides of every axis. Existing voxels keep their
 * physical position; the region index of the output starts at -voxels.
 */
class VolumePadder {
public:
    using ImageType = VolumeType;

    struct Parameters {
        unsigned int voxels = 5;
        short value = 0;
    };

    [[nodiscard]] std::expected<ImageType::Pointer, PreprocessingError>
    apply(ImageType::Pointer input, const Parameters& params = {}) const;
};

}  // namespace dicom_mesher::services
