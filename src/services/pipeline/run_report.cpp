#include "services/pipeline/run_report.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dicom_mesher::services {

const char* toString(StudyOutcome outcome) noexcept
{
    switch (outcome) {
        case StudyOutcome::Accepted: return "accepted";
        case StudyOutcome::SkippedLowQuality: return "skipped_low_quality";
        case StudyOutcome::SkippedDuplicate: return "skipped_duplicate";
        case StudyOutcome::Failed: return "failed";
        case StudyOutcome::Succeeded: return "succeeded";
    }
    return "unknown";
}

void RunReport::add(StudyRecord record)
{
    records_.push_back(std::move(record));
}

RunSummary RunReport::summary() const
{
    RunSummary s;
    s.total = records_.size();
    for (const auto& record : records_) {
        switch (record.outcome) {
            case StudyOutcome::Succeeded: ++s.succeeded; break;
            case StudyOutcome::Failed: ++s.failed; break;
            case StudyOutcome::SkippedLowQuality: ++s.skippedLowQuality; break;
            case StudyOutcome::SkippedDuplicate: ++s.skippedDuplicate; break;
            case StudyOutcome::Accepted: break;
        }
        if (record.isolation) {
            if (record.isolation->succeeded) {
                ++s.isolated;
            } else {
                ++s.isolationFailed;
            }
        }
    }
    return s;
}

int RunReport::exitCode() const
{
    const auto s = summary();
    const size_t failures = s.failed + s.isolationFailed;
    if (failures == 0) {
        return 0;
    }
    const size_t processed = s.succeeded + s.failed;
    const size_t fullySucceeded = s.succeeded - s.isolationFailed;
    if (processed > 0 && fullySucceeded == 0) {
        return 3;
    }
    return 2;
}

std::string RunReport::toJson() const
{
    const auto s = summary();
    nlohmann::json studies = nlohmann::json::array();
    for (const auto& record : records_) {
        nlohmann::json j = {
            {"name", record.name},
            {"path", record.path.string()},
            {"outcome", toString(record.outcome)},
            {"slice_count", record.sliceCount},
            {"elapsed_seconds", record.elapsedSeconds},
        };
        j["patient_key"] = record.patientKey ? nlohmann::json(*record.patientKey) : nlohmann::json();
        if (!record.reason.empty()) {
            j["reason"] = record.reason;
        }
        if (record.outcome == StudyOutcome::Succeeded) {
            j["output"] = record.outputPath.string();
            j["triangles"] = record.triangleCount;
        }
        if (record.isolation) {
            const auto& iso = *record.isolation;
            nlohmann::json isolation = {
                {"succeeded", iso.succeeded},
                {"components", iso.componentCount},
                {"kept_triangles", iso.keptTriangles},
            };
            if (iso.succeeded) {
                isolation["output"] = iso.outputPath.string();
            } else {
                isolation["reason"] = iso.reason;
            }
            j["isolation"] = std::move(isolation);
        }
        studies.push_back(std::move(j));
    }

    nlohmann::json report = {
        {"summary", {
            {"total", s.total},
            {"succeeded", s.succeeded},
            {"failed", s.failed},
            {"skipped_low_quality", s.skippedLowQuality},
            {"skipped_duplicate", s.skippedDuplicate},
            {"isolated", s.isolated},
            {"isolation_failed", s.isolationFailed},
        }},
        {"studies", std::move(studies)},
        {"exit_code", exitCode()},
    };
    return report.dump(2);
}

std::expected<void, PipelineError>
RunReport::writeJson(const std::filesystem::path& path) const
{
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "write_report", "Cannot open " + path.string()});
    }
    out << toJson() << '\n';
    if (!out) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "write_report", "Write failed: " + path.string()});
    }
    return {};
}

void RunReport::logSummary(spdlog::logger& logger) const
{
    const auto s = summary();
    logger.info("Run summary: {} studies, {} succeeded, {} failed, "
                "{} skipped (low quality), {} skipped (duplicate)",
                s.total, s.succeeded, s.failed, s.skippedLowQuality, s.skippedDuplicate);
    if (s.isolated + s.isolationFailed > 0) {
        logger.info("Isolation: {} succeeded, {} failed", s.isolated, s.isolationFailed);
    }
    for (const auto& record : records_) {
        if (record.outcome == StudyOutcome::Failed) {
            logger.warn("  {} failed: {}", record.name, record.reason);
        } else if (record.isolation && !record.isolation->succeeded) {
            logger.warn("  {} isolation failed: {}", record.name, record.isolation->reason);
        }
    }
}

}  // namespace dicom_mesher::services
