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


#include "services/preprocessing/anisotropic_diffusion_filter.hpp"

#include <format>

#include <itkCastImageFilter.h>
#include <itkCurvatureAnisotropicDiffusionImageFilter.h>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("AnisotropicDiffusion");
    return logger;
}

}  // namespace

std::expected<AnisotropicDiffusionFilter::ImageType::Pointer, PreprocessingError>
AnisotropicDiffusionFilter::apply(ImageType::Pointer input, const Parameters& params) const
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
            std::format("Diffusion parameters out of range: {} iterations, conductance {}, time step {}",
                        params.numberOfIterations, params.conductance, params.timeStep)
        });
    }

    try {
        using ToFloat = itk::CastImageFilter<ImageType, InternalImageType>;
        using Diffusion = itk::CurvatureAnisotropicDiffusionImageFilter<InternalImageType, InternalImageType>;
        using ToShort = itk::CastImageFilter<InternalImageType, ImageType>;

        auto toFloat = ToFloat::New();
        toFloat->SetInput(input);

        auto diffusion = Diffusion::New();
        diffusion->SetInput(toFloat->GetOutput());
        diffusion->SetNumberOfIterations(static_cast<unsigned int>(params.numberOfIterations));
        diffusion->SetConductanceParameter(params.conductance);
        diffusion->SetTimeStep(params.effectiveTimeStep());
        diffusion->SetUseImageSpacing(params.useImageSpacing);

        auto toShort = ToShort::New();
        toShort->SetInput(diffusion->GetOutput());
        toShort->Update();

        ImageType::Pointer output = toShort->GetOutput();
        output->DisconnectPipeline();

        getLogger()->debug("Anisotropic diffusion: {} iterations, conductance {:.2f}, time step {:.4f}",
                           params.numberOfIterations, params.conductance, params.effectiveTimeStep());
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
