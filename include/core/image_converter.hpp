#pragma once

#include <array>
#include <expected>
#include <string>

#include <itkImage.h>
#include <vtkImageData.h>
#include <vtkSmartPointer.h>

namespace dicom_mesher::core {

/**
 * @brief Error raised when a volume cannot be handed to the mesher
 */
struct ConversionError {
    enum class Code {
        InvalidInput,
        DegenerateGeometry,
        ProcessingFailed
    };

    Code code = Code::InvalidInput;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::DegenerateGeometry: return "Degenerate geometry: " + message;
            case Code::ProcessingFailed: return "Conversion failed: " + message;
        }
        return "Unknown conversion error";
    }
};

/**
 * @brief Mesh-library view of a preprocessed volume
 *
 * The image carries origin and spacing with an identity direction.
 * The volume direction is kept separately so extracted surfaces can be
 * re-oriented about @c origin into patient space.
 */
struct MeshInput {
    vtkSmartPointer<vtkImageData> image;
    std::array<double, 9> direction = {1, 0, 0, 0, 1, 0, 0, 0, 1};  ///< row-major
    std::array<double, 3> origin = {0, 0, 0};

    [[nodiscard]] bool hasIdentityDirection() const noexcept;
};

/**
 * @brief Image converter from ITK volumes to VTK image data
 */
class ImageConverter {
public:
    using VolumeType = itk::Image<short, 3>;

    /**
     * @brief Convert a preprocessed volume for surface extraction
     *
     * Voxel values, extent, spacing and origin are carried over unchanged.
     *
     * @return MeshInput, or ConversionError for a null or empty volume,
     *         non-positive or non-finite spacing, or a singular direction
     */
    [[nodiscard]] static std::expected<MeshInput, ConversionError>
    toMeshInput(VolumeType::Pointer volume);
};

} // namespace dicom_mesher::core
