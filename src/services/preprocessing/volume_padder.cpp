#include "services/preprocessing/volume_padder.hpp"

#include <itkConstantPadImageFilter.h>

namespace dicom_mesher::services {

std::expected<VolumePadder::ImageType::Pointer, PreprocessingError>
VolumePadder::apply(ImageType::Pointer input, const Parameters& params) const
{
    if (!input) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Input image is null"
        });
    }

    if (params.voxels == 0) {
        return input;
    }

    try {
        using PadFilterType = itk::ConstantPadImageFilter<ImageType, ImageType>;
        auto padFilter = PadFilterType::New();

        ImageType::SizeType bound;
        bound.Fill(params.voxels);

        padFilter->SetInput(input);
        padFilter->SetPadLowerBound(bound);
        padFilter->SetPadUpperBound(bound);
        padFilter->SetConstant(params.value);
        padFilter->Update();

        ImageType::Pointer output = padFilter->GetOutput();
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
