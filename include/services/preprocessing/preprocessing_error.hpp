#pragma once

#include <string>

#include <itkImage.h>

namespace dicom_mesher::services {

/// Volume type flowing through every preprocessing stage
using VolumeType = itk::Image<short, 3>;

/**
 * @brief Error information for preprocessing operations
 */
struct PreprocessingError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ProcessingFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;
    std::string stage;  ///< Stage that failed, filled in by VolumePreprocessor

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        std::string prefix = stage.empty() ? std::string{} : "[" + stage + "] ";
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return prefix + "Invalid input: " + message;
            case Code::InvalidParameters: return prefix + "Invalid parameters: " + message;
            case Code::ProcessingFailed: return prefix + "Processing failed: " + message;
            case Code::InternalError: return prefix + "Internal error: " + message;
        }
        return "Unknown error";
    }
};

}  // namespace dicom_mesher::services
