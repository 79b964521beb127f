#pragma once

#include <array>
#include <expected>

#include <itkImage.h>

#include "services/preprocessing/preprocessing_error.hpp"

namespace dicom_mesher::services {

/**
 * @brief Median filter used to remove speckle from thresholded masks
 *
 * The default radius {1, 1, 0} is an in-plane 3x3x1 window.
 */
class MedianFilter {
public:
    using ImageType = VolumeType;

    struct Parameters {
        std::array<unsigned int, 3> radius = {1, 1, 0};

        [[nodiscard]] bool isValid() const noexcept {
            for (auto r : radius) {
                if (r > 10) {
                    return false;
                }
            }
            return true;
        }
    };

    [[nodiscard]] std::expected<ImageType::Pointer, PreprocessingError>
    apply(ImageType::Pointer input, const Parameters& params = {}) const;
};

}  // namespace dicom_mesher::services
