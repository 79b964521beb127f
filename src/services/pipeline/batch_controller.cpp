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

#include "services/pipeline/batch_controller.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <set>
#include <system_error>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace fs = std::filesystem;

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("BatchController");
    return logger;
}

bool isHidden(const fs::path& path)
{
    const auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

}  // namespace

BatchController::BatchController(BatchOptions options, StudyRunner runner,
                                 std::shared_ptr<const IStudyProbe> probe)
    : options_(std::move(options))
    , runner_(std::move(runner))
    , probe_(std::move(probe))
{
}

BatchController::StudyRunner
BatchController::pipelineRunner(std::shared_ptr<const StudyPipeline> pipeline, PipelineConfig config)
{
    return [pipeline = std::move(pipeline), config = std::move(config)](
               const fs::path& studyDir, const fs::path& outputPath) {
        return pipeline->run(studyDir, outputPath, config);
    };
}

void BatchController::setProgressCallback(ProgressCallback callback)
{
    progressCallback_ = std::move(callback);
}

std::expected<std::vector<fs::path>, PipelineError>
BatchController::discoverStudies(const fs::path& inputRoot)
{
    std::error_code ec;
    fs::directory_iterator it(inputRoot, ec);
    if (ec) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "discover",
            "Cannot list " + inputRoot.string() + ": " + ec.message()});
    }

    std::vector<fs::path> studies;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(PipelineError{
                PipelineError::Code::StudyIO, "discover",
                "Cannot list " + inputRoot.string() + ": " + ec.message()});
        }
        if (it->is_directory(ec) && !isHidden(it->path())) {
            studies.push_back(it->path());
        }
    }
    std::sort(studies.begin(), studies.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
    return studies;
}

fs::path BatchController::outputPathFor(const std::string& studyName, const fs::path& outputDir) const
{
    return outputDir / (options_.prefix + studyName + options_.extension);
}

std::expected<RunReport, PipelineError>
BatchController::run(const fs::path& inputRoot, const fs::path& outputDir) const
{
    auto& logger = getLogger();

    auto studies = discoverStudies(inputRoot);
    if (!studies) {
        return std::unexpected(studies.error());
    }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "prepare_output",
            "Cannot create " + outputDir.string() + ": " + ec.message()});
    }

    logger->info("========================================");
    logger->info("Batch: {} studies in {}", studies->size(), inputRoot.string());
    logger->info("Output: {}", outputDir.string());
    logger->info("Quality gate: {} slices, deduplication {}",
                 options_.lowQualityThreshold, options_.deduplicatePatients ? "on" : "off");
    logger->info("========================================");

    const auto runStart = std::chrono::steady_clock::now();
    RunReport report;
    std::set<std::string> acceptedKeys;
    const size_t total = studies->size();

    for (size_t index = 0; index < total; ++index) {
        const auto& studyDir = (*studies)[index];
        const auto studyStart = std::chrono::steady_clock::now();

        StudyRecord record;
        record.name = studyDir.filename().string();
        record.path = studyDir;

        logger->info("[{}/{}] {}", index + 1, total, record.name);

        auto finishRecord = [&](StudyRecord&& finished) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - studyStart;
            finished.elapsedSeconds = elapsed.count();
            if (progressCallback_) {
                progressCallback_(index, total, finished);
            }
            report.add(std::move(finished));
        };

        std::expected<StudyProbeResult, PipelineError> probed;
        try {
            probed = probe_->probe(studyDir, options_.deduplicatePatients);
        } catch (const std::exception& e) {
            probed = std::unexpected(PipelineError{
                PipelineError::Code::InternalError, "probe",
                std::string("Unexpected exception: ") + e.what()});
        }
        if (!probed) {
            record.outcome = StudyOutcome::Failed;
            record.reason = probed.error().toString();
            logger->error("  probe failed: {}", record.reason);
            finishRecord(std::move(record));
            continue;
        }
        record.sliceCount = probed->sliceCount;
        record.patientKey = probed->patientKey;

        if (record.sliceCount < options_.lowQualityThreshold) {
            record.outcome = StudyOutcome::SkippedLowQuality;
            record.reason = std::to_string(record.sliceCount) + " slices, fewer than " +
                            std::to_string(options_.lowQualityThreshold);
            logger->info("  skipped: {}", record.reason);
            finishRecord(std::move(record));
            continue;
        }

        if (options_.deduplicatePatients && record.patientKey) {
            if (acceptedKeys.contains(*record.patientKey)) {
                record.outcome = StudyOutcome::SkippedDuplicate;
                record.reason = "duplicate of an earlier study (" + *record.patientKey + ")";
                logger->info("  skipped: {}", record.reason);
                finishRecord(std::move(record));
                continue;
            }
            acceptedKeys.insert(*record.patientKey);
        }

        record.outcome = StudyOutcome::Accepted;
        const auto outputPath = outputPathFor(record.name, outputDir);
        logger->debug("  accepted, {} slices -> {}", record.sliceCount, outputPath.string());

        try {
            auto result = runner_(studyDir, outputPath);
            if (result) {
                record.outcome = StudyOutcome::Succeeded;
                record.outputPath = result->outputPath.empty() ? outputPath : result->outputPath;
                record.triangleCount = result->triangleCount;
            } else {
                record.outcome = StudyOutcome::Failed;
                record.reason = result.error().toString();
            }
        } catch (const std::exception& e) {
            record.outcome = StudyOutcome::Failed;
            record.reason = std::string("Unexpected exception: ") + e.what();
        }

        if (record.outcome == StudyOutcome::Succeeded) {
            logger->info("  done: {} triangles", record.triangleCount);
        } else {
            logger->error("  failed: {}", record.reason);
        }
        finishRecord(std::move(record));
        logger->info("  {:.1f}s", report.records().back().elapsedSeconds);
    }

    const std::chrono::duration<double> runElapsed = std::chrono::steady_clock::now() - runStart;
    report.logSummary(*logger);
    logger->info("Batch finished in {:.1f}s", runElapsed.count());
    return report;
}

}  // namespace dicom_mesher::services
