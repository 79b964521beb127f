#include "services/preprocessing/median_filter.hpp"

#include <itkMedianImageFilter.h>

namespace dicom_mesher::services {

std::expected<MedianFilter::ImageType::Pointer, PreprocessingError>
MedianFilter::apply(ImageType::Pointer input, const Parameters& params) const
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
            "Median radius must be at most 10 voxels per axis"
        });
    }

    try {
        using FilterType = itk::MedianImageFilter<ImageType, ImageType>;
        auto filter = FilterType::New();

        FilterType::InputSizeType radius;
        for (unsigned int axis = 0; axis < 3; ++axis) {
            radius[axis] = params.radius[axis];
        }
        filter->SetRadius(radius);
        filter->SetInput(input);
        filter->Update();

        ImageType::Pointer output = filter->GetOutput();
        output->DisconnectPipeline();
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
