#include "services/preprocessing/anisotropic_diffusion_filter.hpp"

#include <gtest/gtest.h>

#include <cmath>

#include <itkImageRegionConstIterator.h>

#include "services/preprocessing/double_threshold_filter.hpp"
#include "services/preprocessing/tissue_table.hpp"
#include "test_utils/volume_generator.hpp"

namespace dicom_mesher::services {
namespace {

/// Spread of the voxel values within @p radius of the volume center
double spreadNearCenter(const VolumeType* volume, double radius)
{
    const auto size = volume->GetLargestPossibleRegion().GetSize();
    const double center = static_cast<double>(size[0]) / 2.0;

    double sum = 0.0;
    double sumSq = 0.0;
    size_t n = 0;
    itk::ImageRegionConstIterator<VolumeType> it(volume, volume->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        const double dx = idx[0] - center;
        const double dy = idx[1] - center;
        const double dz = idx[2] - center;
        if (dx * dx + dy * dy + dz * dz <= radius * radius) {
            sum += it.Get();
            sumSq += static_cast<double>(it.Get()) * it.Get();
            ++n;
        }
    }
    const double mean = sum / static_cast<double>(n);
    return std::sqrt(sumSq / static_cast<double>(n) - mean * mean);
}

size_t countInside(const VolumeType* mask)
{
    size_t count = 0;
    itk::ImageRegionConstIterator<VolumeType> it(mask, mask->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() != 0) ++count;
    }
    return count;
}

class AnisotropicDiffusionFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        head_ = test_utils::createSyntheticHeadVolume(32);
    }

    VolumeType::Pointer boneMask(VolumeType::Pointer volume) const {
        auto bone = TissueTable::lookup("bone");
        EXPECT_TRUE(bone.has_value());
        auto mask = DoubleThresholdFilter{}.apply(
            volume, DoubleThresholdFilter::Parameters::fromTissue(*bone));
        EXPECT_TRUE(mask.has_value());
        return mask ? *mask : VolumeType::Pointer{};
    }

    VolumeType::Pointer head_;
    AnisotropicDiffusionFilter filter_;
};

// =============================================================================
// Parameters
// =============================================================================

TEST_F(AnisotropicDiffusionFilterTest, DefaultParameters) {
    AnisotropicDiffusionFilter::Parameters params;
    EXPECT_TRUE(params.isValid());
    EXPECT_EQ(params.numberOfIterations, 5);
    EXPECT_DOUBLE_EQ(params.conductance, 3.0);
    EXPECT_DOUBLE_EQ(params.effectiveTimeStep(), 0.03);
}

TEST_F(AnisotropicDiffusionFilterTest, ZeroTimeStepPicksStableDefault) {
    AnisotropicDiffusionFilter::Parameters params;
    params.timeStep = 0.0;
    EXPECT_TRUE(params.isValid());
    EXPECT_DOUBLE_EQ(params.effectiveTimeStep(), 0.0625);
}

TEST_F(AnisotropicDiffusionFilterTest, OutOfRangeParametersRejected) {
    AnisotropicDiffusionFilter::Parameters params;
    params.numberOfIterations = 0;
    EXPECT_FALSE(params.isValid());

    params = {};
    params.conductance = 0.2;
    EXPECT_FALSE(params.isValid());

    params = {};
    params.timeStep = 0.2;
    EXPECT_FALSE(params.isValid());

    auto result = filter_.apply(head_, params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidParameters);
}

TEST_F(AnisotropicDiffusionFilterTest, NullInputFails) {
    auto result = filter_.apply(nullptr);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidInput);
}

// =============================================================================
// Smoothing ahead of the bone threshold
// =============================================================================

TEST_F(AnisotropicDiffusionFilterTest, GeometryIsKept) {
    auto volume = test_utils::createVolume({12, 10, 8}, {0.5, 0.5, 2.0}, {-10.0, 5.0, 3.0}, 40);

    auto result = filter_.apply(volume);
    ASSERT_TRUE(result.has_value());

    const auto& output = *result;
    EXPECT_EQ(output->GetLargestPossibleRegion().GetSize(),
              volume->GetLargestPossibleRegion().GetSize());
    EXPECT_EQ(output->GetSpacing(), volume->GetSpacing());
    EXPECT_EQ(output->GetOrigin(), volume->GetOrigin());
    EXPECT_EQ(output->GetDirection(), volume->GetDirection());
}

TEST_F(AnisotropicDiffusionFilterTest, InputIsNotModified) {
    VolumeType::IndexType brain = {{16, 16, 16}};
    const short before = head_->GetPixel(brain);

    auto result = filter_.apply(head_);
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->GetPointer(), head_.GetPointer());
    EXPECT_EQ(head_->GetPixel(brain), before);
}

TEST_F(AnisotropicDiffusionFilterTest, SoftTissueNoiseIsReduced) {
    auto result = filter_.apply(head_);
    ASSERT_TRUE(result.has_value());

    EXPECT_LT(spreadNearCenter(result->GetPointer(), 6.0),
              spreadNearCenter(head_.GetPointer(), 6.0));
}

TEST_F(AnisotropicDiffusionFilterTest, SkullSurvivesBoneThreshold) {
    auto result = filter_.apply(head_);
    ASSERT_TRUE(result.has_value());

    auto rawMask = boneMask(head_);
    auto smoothMask = boneMask(*result);
    ASSERT_TRUE(rawMask.IsNotNull());
    ASSERT_TRUE(smoothMask.IsNotNull());

    VolumeType::IndexType shell = {{27, 16, 16}};
    VolumeType::IndexType brain = {{16, 16, 16}};
    VolumeType::IndexType corner = {{0, 0, 0}};
    EXPECT_EQ(smoothMask->GetPixel(shell), 255);
    EXPECT_EQ(smoothMask->GetPixel(brain), 0);
    EXPECT_EQ(smoothMask->GetPixel(corner), 0);

    // The shell keeps its thickness
    const double raw = static_cast<double>(countInside(rawMask));
    const double smooth = static_cast<double>(countInside(smoothMask));
    EXPECT_NEAR(smooth / raw, 1.0, 0.15);
}

}  // namespace
}  // namespace dicom_mesher::services
