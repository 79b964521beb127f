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

#include <string>

namespace dicom_mesher::services {

/**
 * @brief Error reported by a study-level operation
 *
 * @c stage names the step that failed (e.g. "double_threshold",
 * "decimate", "read_series") so a failed study can be triaged from the
 * run report alone.
 */
struct PipelineError {
    enum class Code {
        Success,
        UnknownTissue,
        InvalidConfiguration,
        StudyIO,
        Preprocess,
        Conversion,
        MeshStage,
        NoTargetObject,
        InternalError
    };

    Code code = Code::Success;
    std::string stage;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] static const char* codeName(Code code) noexcept {
        switch (code) {
            case Code::Success: return "Success";
            case Code::UnknownTissue: return "UnknownTissue";
            case Code::InvalidConfiguration: return "InvalidConfiguration";
            case Code::StudyIO: return "StudyIO";
            case Code::Preprocess: return "Preprocess";
            case Code::Conversion: return "Conversion";
            case Code::MeshStage: return "MeshStage";
            case Code::NoTargetObject: return "NoTargetObject";
            case Code::InternalError: return "InternalError";
        }
        return "Unknown";
    }

    [[nodiscard]] std::string toString() const {
        if (code == Code::Success) {
            return "Success";
        }
        std::string text = codeName(code);
        if (!stage.empty()) {
            text += " [" + stage + "]";
        }
        return text + ": " + message;
    }
};

}  // namespace dicom_mesher::services
