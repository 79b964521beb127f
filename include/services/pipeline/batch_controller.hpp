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
 * @file batch_controller.hpp
 * @brief Unattended conversion of a directory of studies
 * @details Every immediate, non-hidden subdirectory of the input root is a
 *          study. Each study is probed, gated on its slice count and
 *          optionally deduplicated by patient before it is handed to the
 *          study runner. A failing study is recorded and the run goes on.
 */

#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "services/pipeline/pipeline_config.hpp"
#include "services/pipeline/run_report.hpp"
#include "services/pipeline/study_pipeline.hpp"
#include "services/pipeline/study_probe.hpp"

namespace dicom_mesher::services {

struct BatchOptions {
    /// Studies with fewer slices are skipped
    size_t lowQualityThreshold = 160;

    /// Skip studies whose patient key was already accepted in this run
    bool deduplicatePatients = false;

    std::string prefix;
    std::string extension = ".stl";
};

class BatchController {
public:
    /// Converts one study directory into one mesh file
    using StudyRunner = std::function<std::expected<StudyResult, PipelineError>(
        const std::filesystem::path& studyDir, const std::filesystem::path& outputPath)>;

    /// Called after each study has reached its final outcome
    using ProgressCallback = std::function<void(size_t index, size_t total, const StudyRecord& record)>;

    BatchController(BatchOptions options, StudyRunner runner,
                    std::shared_ptr<const IStudyProbe> probe = std::make_shared<DicomStudyProbe>());

    /// Runner backed by @p pipeline with the fixed run configuration @p config
    [[nodiscard]] static StudyRunner
    pipelineRunner(std::shared_ptr<const StudyPipeline> pipeline, PipelineConfig config);

    void setProgressCallback(ProgressCallback callback);

    [[nodiscard]] const BatchOptions& options() const noexcept { return options_; }

    /**
     * @brief Process every study below @p inputRoot
     * @return The run report; an error only when @p inputRoot cannot be
     *         listed or @p outputDir cannot be created
     */
    [[nodiscard]] std::expected<RunReport, PipelineError>
    run(const std::filesystem::path& inputRoot,
        const std::filesystem::path& outputDir) const;

    /// Immediate non-hidden subdirectories, sorted by name
    [[nodiscard]] static std::expected<std::vector<std::filesystem::path>, PipelineError>
    discoverStudies(const std::filesystem::path& inputRoot);

    /// `<outputDir>/<prefix><studyName><extension>`
    [[nodiscard]] std::filesystem::path
    outputPathFor(const std::string& studyName, const std::filesystem::path& outputDir) const;

private:
    BatchOptions options_;
    StudyRunner runner_;
    std::shared_ptr<const IStudyProbe> probe_;
    ProgressCallback progressCallback_;
};

}  // namespace dicom_mesher::services
