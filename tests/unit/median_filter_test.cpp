#include "services/preprocessing/median_filter.hpp"

#include <gtest/gtest.h>

#include "test_utils/volume_generator.hpp"

namespace dicom_mesher::services {
namespace {

using test_utils::createVolume;

TEST(MedianFilterTest, NullInputFails) {
    MedianFilter filter;
    auto result = filter.apply(nullptr);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidInput);
}

TEST(MedianFilterTest, OversizedRadiusIsInvalid) {
    MedianFilter filter;
    MedianFilter::Parameters params;
    params.radius = {11, 1, 0};

    auto result = filter.apply(createVolume(8), params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidParameters);
}

TEST(MedianFilterTest, SpeckleRemovedBlockKept) {
    auto mask = createVolume({9, 9, 3});

    // Isolated voxel and a 3x3 in-plane block through all slices
    VolumeType::IndexType speckle = {{1, 1, 1}};
    mask->SetPixel(speckle, 255);
    for (int z = 0; z < 3; ++z) {
        for (int y = 4; y <= 6; ++y) {
            for (int x = 4; x <= 6; ++x) {
                VolumeType::IndexType idx = {{x, y, z}};
                mask->SetPixel(idx, 255);
            }
        }
    }

    MedianFilter filter;
    auto result = filter.apply(mask);
    ASSERT_TRUE(result.has_value());

    VolumeType::IndexType blockCenter = {{5, 5, 1}};
    EXPECT_EQ((*result)->GetPixel(speckle), 0);
    EXPECT_EQ((*result)->GetPixel(blockCenter), 255);

    // Input untouched, geometry kept
    EXPECT_EQ(mask->GetPixel(speckle), 255);
    EXPECT_EQ((*result)->GetLargestPossibleRegion().GetSize(),
              mask->GetLargestPossibleRegion().GetSize());
}

}  // namespace
}  // namespace dicom_mesher::services
