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
 * @file run_report.hpp
 * @brief Per-study records of a batch run
 * @details The batch controller appends one StudyRecord per discovered
 *          study, in discovery order. Records are never removed; the
 *          two-stage driver only fills in the isolation outcome of
 *          succeeded studies.
 */

#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "services/pipeline_error.hpp"

namespace spdlog {
class logger;
}

namespace dicom_mesher::services {

/**
 * @brief Study state
 *
 * Discovered studies end in SkippedLowQuality or SkippedDuplicate, or
 * pass through Accepted to Succeeded or Failed.
 */
enum class StudyOutcome {
    Accepted,
    SkippedLowQuality,
    SkippedDuplicate,
    Failed,
    Succeeded
};

[[nodiscard]] const char* toString(StudyOutcome outcome) noexcept;

/// Isolation outcome of one study (two-stage runs only)
struct IsolationRecord {
    bool succeeded = false;
    std::string reason;
    std::filesystem::path outputPath;
    size_t componentCount = 0;
    size_t keptTriangles = 0;
};

struct StudyRecord {
    std::string name;
    std::filesystem::path path;
    std::optional<std::string> patientKey;
    size_t sliceCount = 0;
    StudyOutcome outcome = StudyOutcome::Accepted;
    std::string reason;                     ///< Skip or failure reason
    std::filesystem::path outputPath;       ///< Set on success
    size_t triangleCount = 0;
    double elapsedSeconds = 0.0;
    std::optional<IsolationRecord> isolation;
};

struct RunSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t skippedLowQuality = 0;
    size_t skippedDuplicate = 0;
    size_t isolated = 0;
    size_t isolationFailed = 0;
};

class RunReport {
public:
    void add(StudyRecord record);

    [[nodiscard]] const std::vector<StudyRecord>& records() const noexcept { return records_; }
    [[nodiscard]] std::vector<StudyRecord>& records() noexcept { return records_; }

    [[nodiscard]] RunSummary summary() const;

    /**
     * @brief Process exit status for this run
     * @return 0 when nothing failed, 2 when some studies failed, 3 when
     *         every processed study failed
     *
     * A failed isolation counts as a failed study.
     */
    [[nodiscard]] int exitCode() const;

    [[nodiscard]] std::string toJson() const;

    [[nodiscard]] std::expected<void, PipelineError>
    writeJson(const std::filesystem::path& path) const;

    void logSummary(spdlog::logger& logger) const;

private:
    std::vector<StudyRecord> records_;
};

}  // namespace dicom_mesher::services
