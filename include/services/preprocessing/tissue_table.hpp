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

#include <array>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "services/pipeline_error.hpp"

namespace dicom_mesher::services {

/**
 * @brief Double-threshold parameters for one tissue class (CT, HU)
 *
 * Voxels inside [innerLowThreshold, innerHighThreshold] seed the object;
 * it then grows through voxels connected to a seed that lie inside the
 * wider [lowThreshold, highThreshold] band.
 */
struct TissueConfig {
    std::string name;
    double lowThreshold = 0.0;
    double innerLowThreshold = 0.0;
    double innerHighThreshold = 0.0;
    double highThreshold = 0.0;
    bool useMedian = false;
    double defaultIsoValue = 64.0;

    [[nodiscard]] bool isValid() const noexcept {
        return lowThreshold <= innerLowThreshold &&
               innerLowThreshold <= innerHighThreshold &&
               innerHighThreshold <= highThreshold &&
               lowThreshold < highThreshold;
    }

    bool operator==(const TissueConfig&) const = default;
};

/**
 * @brief Static tissue keyword to threshold table
 *
 * Keywords are matched case-insensitively; "soft_tissue" and "soft-tissue"
 * are accepted for "soft", "bones" for "bone".
 */
class TissueTable {
public:
    [[nodiscard]] static std::expected<TissueConfig, PipelineError>
    lookup(std::string_view name);

    /// Canonical tissue keywords in table order
    [[nodiscard]] static std::vector<std::string> names();

    /**
     * @brief Ad-hoc tissue from four explicit thresholds
     *
     * The values are sorted ascending. Median filtering is off.
     */
    [[nodiscard]] static std::expected<TissueConfig, PipelineError>
    custom(std::vector<double> thresholds);
};

}  // namespace dicom_mesher::services
