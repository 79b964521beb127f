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

#include "core/image_converter.hpp"

#include <cmath>
#include <format>

#include <itkImageToVTKImageFilter.h>

namespace dicom_mesher::core {

namespace {

constexpr double kIdentityTolerance = 1e-6;
constexpr double kSingularTolerance = 1e-9;

double determinant(const std::array<double, 9>& m) {
    return m[0] * (m[4] * m[8] - m[5] * m[7])
         - m[1] * (m[3] * m[8] - m[5] * m[6])
         + m[2] * (m[3] * m[7] - m[4] * m[6]);
}

}  // namespace

bool MeshInput::hasIdentityDirection() const noexcept
{
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            const double expected = (row == col) ? 1.0 : 0.0;
            if (std::abs(direction[row * 3 + col] - expected) > kIdentityTolerance) {
                return false;
            }
        }
    }
    return true;
}

std::expected<MeshInput, ConversionError>
ImageConverter::toMeshInput(VolumeType::Pointer volume)
{
    if (!volume) {
        return std::unexpected(ConversionError{
            ConversionError::Code::InvalidInput, "Volume is null"});
    }

    const auto size = volume->GetLargestPossibleRegion().GetSize();
    if (size[0] == 0 || size[1] == 0 || size[2] == 0) {
        return std::unexpected(ConversionError{
            ConversionError::Code::InvalidInput,
            std::format("Volume is empty ({}x{}x{})", size[0], size[1], size[2])});
    }

    const auto spacing = volume->GetSpacing();
    for (unsigned int axis = 0; axis < 3; ++axis) {
        if (!std::isfinite(spacing[axis]) || spacing[axis] <= 0.0) {
            return std::unexpected(ConversionError{
                ConversionError::Code::DegenerateGeometry,
                std::format("Spacing along axis {} is {}", axis, spacing[axis])});
        }
    }

    MeshInput input;
    const auto& direction = volume->GetDirection();
    for (unsigned int row = 0; row < 3; ++row) {
        for (unsigned int col = 0; col < 3; ++col) {
            input.direction[row * 3 + col] = direction[row][col];
        }
    }
    if (std::abs(determinant(input.direction)) < kSingularTolerance) {
        return std::unexpected(ConversionError{
            ConversionError::Code::DegenerateGeometry,
            "Direction matrix is singular"});
    }

    const auto origin = volume->GetOrigin();
    for (unsigned int axis = 0; axis < 3; ++axis) {
        input.origin[axis] = origin[axis];
    }

    try {
        using ConnectorType = itk::ImageToVTKImageFilter<VolumeType>;
        auto connector = ConnectorType::New();
        connector->SetInput(volume);
        connector->Update();

        input.image = vtkSmartPointer<vtkImageData>::New();
        input.image->DeepCopy(connector->GetOutput());
        // Orientation is re-applied to the surface, not the grid
        input.image->SetDirectionMatrix(1, 0, 0, 0, 1, 0, 0, 0, 1);
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(ConversionError{
            ConversionError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()});
    }

    return input;
}

} // namespace dicom_mesher::core
