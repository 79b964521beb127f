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

/**
 * @file dicom_loader.hpp
 * @brief DICOM header reading, series discovery and volume assembly
 * @details Provides the DicomLoader class for reading the identifying
 *          header fields of a DICOM file, grouping the files of a directory
 *          tree into series, and reading a series (or any single volume
 *          file ITK can open) into a signed 16-bit 3-D volume.
 *
 *          Slice ordering inside a series is delegated to GDCM.
 */

#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace dicom_mesher::core {

/// Header fields used for study identity, filtering and reporting
struct DicomMetadata {
    std::string patientId;
    std::string studyInstanceUid;
    std::string seriesInstanceUid;
    std::string modality;
    std::string bodyPartExamined;
};

/// One GDCM-ordered series found while scanning a directory
struct SliceSeries {
    std::string seriesInstanceUid;
    std::vector<std::filesystem::path> files;
};

/// Error types for DICOM loading
enum class DicomError {
    FileNotFound,
    InvalidDicomFormat,
    NoSeriesFound,
    SeriesAssemblyFailed,
    VolumeReadFailed
};

/// Error result with message
struct DicomErrorInfo {
    DicomError code;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case DicomError::FileNotFound: return "File not found: " + message;
            case DicomError::InvalidDicomFormat: return "Invalid DICOM: " + message;
            case DicomError::NoSeriesFound: return "No DICOM series: " + message;
            case DicomError::SeriesAssemblyFailed: return "Series assembly failed: " + message;
            case DicomError::VolumeReadFailed: return "Volume read failed: " + message;
        }
        return "Unknown DICOM error";
    }
};

/// Signed 16-bit volume in Hounsfield units (CT) or raw intensity
using VolumeType = itk::Image<short, 3>;

/**
 * @brief DICOM file loader and series assembler
 */
class DicomLoader {
public:
    DicomLoader();
    ~DicomLoader();

    // Non-copyable, movable
    DicomLoader(const DicomLoader&) = delete;
    DicomLoader& operator=(const DicomLoader&) = delete;
    DicomLoader(DicomLoader&&) noexcept;
    DicomLoader& operator=(DicomLoader&&) noexcept;

    /**
     * @brief Read the header of a single DICOM file
     *
     * Pixel data is not decoded.
     *
     * @param filePath Path to the DICOM file
     * @return Metadata on success, error info on failure
     */
    std::expected<DicomMetadata, DicomErrorInfo>
    loadFile(const std::filesystem::path& filePath);

    /**
     * @brief Group the DICOM files below a directory by series
     * @param directoryPath Directory to scan
     * @param recursive Descend into subdirectories
     * @return Series Instance UID to ordered file list
     */
    std::expected<std::map<std::string, SliceSeries>, DicomErrorInfo>
    scanDirectory(const std::filesystem::path& directoryPath, bool recursive = true);

    /**
     * @brief Read an ordered list of slice files into one volume
     * @param files Slice files in GDCM order
     * @return ITK 3D image on success
     */
    std::expected<VolumeType::Pointer, DicomErrorInfo>
    loadSeries(const std::vector<std::filesystem::path>& files);

    /**
     * @brief Read a self-contained volume file (MetaImage, NRRD, NIfTI, DICOM...)
     */
    std::expected<VolumeType::Pointer, DicomErrorInfo>
    readVolumeFile(const std::filesystem::path& filePath);

    /// Whether the file name carries a `.dcm` extension (case-insensitive)
    [[nodiscard]] static bool hasDicomExtension(const std::filesystem::path& filePath);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_mesher::core
