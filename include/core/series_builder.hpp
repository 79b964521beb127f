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

#pragma once

#include "dicom_loader.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dicom_mesher::core {

/// Series information with metadata summary
struct SeriesInfo {
    std::string seriesInstanceUid;
    std::string modality;
    size_t sliceCount = 0;
    std::vector<std::filesystem::path> files;
};

/// A volume read from the largest series of a study, with its header fields
struct LoadedSeries {
    VolumeType::Pointer volume;
    DicomMetadata metadata;
    size_t sliceCount = 0;
};

/**
 * @brief High-level series builder for DICOM volume assembly
 *
 * Scans a study directory, groups slices by series and reads the series
 * with the most slices as the study volume.
 */
class SeriesBuilder {
public:
    SeriesBuilder();
    ~SeriesBuilder();

    // Non-copyable, movable
    SeriesBuilder(const SeriesBuilder&) = delete;
    SeriesBuilder& operator=(const SeriesBuilder&) = delete;
    SeriesBuilder(SeriesBuilder&&) noexcept;
    SeriesBuilder& operator=(SeriesBuilder&&) noexcept;

    /**
     * @brief Scan directory (recursively) and return available series
     * @param directoryPath Path to directory containing DICOM files
     * @return Series sorted by descending slice count
     */
    std::expected<std::vector<SeriesInfo>, DicomErrorInfo>
    scanForSeries(const std::filesystem::path& directoryPath);

    /**
     * @brief Build 3D volume from a specific series
     */
    std::expected<LoadedSeries, DicomErrorInfo>
    buildVolume(const SeriesInfo& series);

    /**
     * @brief Scan a study directory and build the series with the most slices
     *
     * Ties are broken by Series Instance UID so the choice is stable.
     */
    std::expected<LoadedSeries, DicomErrorInfo>
    loadLargestSeries(const std::filesystem::path& directoryPath);

    /// Series with the most slices, or nullptr for an empty list
    [[nodiscard]] static const SeriesInfo* selectLargest(const std::vector<SeriesInfo>& series);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_mesher::core
