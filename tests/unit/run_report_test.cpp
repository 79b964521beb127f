#include "services/pipeline/run_report.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

namespace dicom_mesher::services {
namespace {

StudyRecord record(const std::string& name, StudyOutcome outcome)
{
    StudyRecord r;
    r.name = name;
    r.path = "/data/" + name;
    r.outcome = outcome;
    r.sliceCount = 200;
    if (outcome == StudyOutcome::Succeeded) {
        r.outputPath = "/out/" + name + ".stl";
        r.triangleCount = 1234;
    }
    return r;
}

IsolationRecord isolation(bool succeeded)
{
    IsolationRecord iso;
    iso.succeeded = succeeded;
    iso.componentCount = 3;
    if (succeeded) {
        iso.outputPath = "/out/final.stl";
        iso.keptTriangles = 1000;
    } else {
        iso.reason = "no plausible component";
    }
    return iso;
}

TEST(RunReportTest, OutcomeNames) {
    EXPECT_STREQ(toString(StudyOutcome::Succeeded), "succeeded");
    EXPECT_STREQ(toString(StudyOutcome::SkippedLowQuality), "skipped_low_quality");
    EXPECT_STREQ(toString(StudyOutcome::SkippedDuplicate), "skipped_duplicate");
    EXPECT_STREQ(toString(StudyOutcome::Failed), "failed");
}

TEST(RunReportTest, SummaryCountsOutcomes) {
    RunReport report;
    report.add(record("a", StudyOutcome::Succeeded));
    report.add(record("b", StudyOutcome::Failed));
    report.add(record("c", StudyOutcome::SkippedLowQuality));
    report.add(record("d", StudyOutcome::SkippedDuplicate));
    report.add(record("e", StudyOutcome::Succeeded));

    auto s = report.summary();
    EXPECT_EQ(s.total, 5u);
    EXPECT_EQ(s.succeeded, 2u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.skippedLowQuality, 1u);
    EXPECT_EQ(s.skippedDuplicate, 1u);
}

TEST(RunReportTest, RecordsKeepInsertionOrder) {
    RunReport report;
    report.add(record("z", StudyOutcome::Succeeded));
    report.add(record("a", StudyOutcome::Failed));

    ASSERT_EQ(report.records().size(), 2u);
    EXPECT_EQ(report.records()[0].name, "z");
    EXPECT_EQ(report.records()[1].name, "a");
}

TEST(RunReportTest, ExitCodeAllGood) {
    RunReport report;
    report.add(record("a", StudyOutcome::Succeeded));
    report.add(record("b", StudyOutcome::SkippedLowQuality));
    EXPECT_EQ(report.exitCode(), 0);
}

TEST(RunReportTest, ExitCodeEmptyRunIsSuccess) {
    RunReport report;
    EXPECT_EQ(report.exitCode(), 0);
}

TEST(RunReportTest, ExitCodeSomeFailed) {
    RunReport report;
    report.add(record("a", StudyOutcome::Succeeded));
    report.add(record("b", StudyOutcome::Failed));
    EXPECT_EQ(report.exitCode(), 2);
}

TEST(RunReportTest, ExitCodeAllFailed) {
    RunReport report;
    report.add(record("a", StudyOutcome::Failed));
    report.add(record("b", StudyOutcome::Failed));
    report.add(record("c", StudyOutcome::SkippedDuplicate));
    EXPECT_EQ(report.exitCode(), 3);
}

TEST(RunReportTest, FailedIsolationCountsAsFailure) {
    RunReport report;
    auto good = record("a", StudyOutcome::Succeeded);
    good.isolation = isolation(true);
    auto bad = record("b", StudyOutcome::Succeeded);
    bad.isolation = isolation(false);
    report.add(good);
    report.add(bad);

    auto s = report.summary();
    EXPECT_EQ(s.isolated, 1u);
    EXPECT_EQ(s.isolationFailed, 1u);
    EXPECT_EQ(report.exitCode(), 2);

    report.records()[0].isolation = isolation(false);
    EXPECT_EQ(report.exitCode(), 3);
}

TEST(RunReportTest, JsonLayout) {
    RunReport report;
    auto ok = record("case01", StudyOutcome::Succeeded);
    ok.patientKey = "patient:P1";
    ok.isolation = isolation(true);
    report.add(ok);

    auto skipped = record("case02", StudyOutcome::SkippedLowQuality);
    skipped.sliceCount = 42;
    skipped.reason = "42 slices, fewer than 160";
    report.add(skipped);

    auto json = nlohmann::json::parse(report.toJson());

    EXPECT_EQ(json["summary"]["total"], 2);
    EXPECT_EQ(json["summary"]["succeeded"], 1);
    EXPECT_EQ(json["summary"]["isolated"], 1);
    EXPECT_EQ(json["exit_code"], 0);

    const auto& studies = json["studies"];
    ASSERT_EQ(studies.size(), 2u);
    EXPECT_EQ(studies[0]["name"], "case01");
    EXPECT_EQ(studies[0]["outcome"], "succeeded");
    EXPECT_EQ(studies[0]["patient_key"], "patient:P1");
    EXPECT_EQ(studies[0]["output"], "/out/case01.stl");
    EXPECT_EQ(studies[0]["triangles"], 1234);
    EXPECT_EQ(studies[0]["isolation"]["output"], "/out/final.stl");

    EXPECT_EQ(studies[1]["outcome"], "skipped_low_quality");
    EXPECT_TRUE(studies[1]["patient_key"].is_null());
    EXPECT_EQ(studies[1]["slice_count"], 42);
    EXPECT_EQ(studies[1]["reason"], "42 slices, fewer than 160");
    EXPECT_FALSE(studies[1].contains("output"));
}

TEST(RunReportTest, WriteJsonToFile) {
    RunReport report;
    report.add(record("a", StudyOutcome::Failed));

    auto path = std::filesystem::temp_directory_path() / "dicom_mesher_report_test.json";
    ASSERT_TRUE(report.writeJson(path).has_value());

    std::ifstream in(path);
    auto json = nlohmann::json::parse(in);
    std::filesystem::remove(path);

    EXPECT_EQ(json["summary"]["failed"], 1);
    EXPECT_EQ(json["exit_code"], 3);
}

TEST(RunReportTest, WriteJsonToMissingDirectoryFails) {
    RunReport report;
    auto result = report.writeJson("/nonexistent/dir/report.json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::StudyIO);
    EXPECT_EQ(result.error().stage, "write_report");
}

TEST(RunReportTest, LogSummaryListsFailures) {
    std::ostringstream stream;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    spdlog::logger logger("report_test", sink);
    logger.set_pattern("%v");

    RunReport report;
    auto failed = record("broken_case", StudyOutcome::Failed);
    failed.reason = "read_series: no DICOM files";
    report.add(failed);
    report.add(record("fine_case", StudyOutcome::Succeeded));

    report.logSummary(logger);
    logger.flush();

    const auto text = stream.str();
    EXPECT_NE(text.find("2 studies, 1 succeeded, 1 failed"), std::string::npos);
    EXPECT_NE(text.find("broken_case failed: read_series: no DICOM files"), std::string::npos);
    EXPECT_EQ(text.find("fine_case"), std::string::npos);
}

}  // namespace
}  // namespace dicom_mesher::services
