#include "services/pipeline/two_stage_driver.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

#include "core/logging.hpp"
#include "services/mesh/mesh_io.hpp"

namespace dicom_mesher::services {

namespace fs = std::filesystem;

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("TwoStageDriver");
    return logger;
}

PipelineError ioError(const std::string& stage, const std::string& message)
{
    return PipelineError{PipelineError::Code::StudyIO, stage, message};
}

}  // namespace

TwoStageDriver::TwoStageDriver(BatchController batch, std::shared_ptr<const ObjectIsolator> isolator)
    : batch_(std::move(batch))
    , isolator_(std::move(isolator))
{
}

fs::path TwoStageDriver::intermediateDirectory(const fs::path& outputRoot)
{
    return outputRoot / "intermediate";
}

IsolationRecord TwoStageDriver::isolateOne(const fs::path& meshPath, const fs::path& outputPath) const
{
    IsolationRecord record;
    auto isolated = isolator_->isolate(meshPath, outputPath);
    if (isolated) {
        record.succeeded = true;
        record.outputPath = isolated->outputPath;
        record.componentCount = isolated->componentCount;
        record.keptTriangles = isolated->keptTriangles;
        getLogger()->info("Isolated {}: kept {} triangles of {} components",
                          meshPath.filename().string(), record.keptTriangles, record.componentCount);
    } else {
        record.reason = isolated.error().toString();
        getLogger()->error("Isolation of {} failed: {}", meshPath.filename().string(), record.reason);
    }
    return record;
}

std::expected<RunReport, PipelineError>
TwoStageDriver::run(const fs::path& inputRoot, const fs::path& outputRoot, bool keepIntermediate) const
{
    const auto intermediate = intermediateDirectory(outputRoot);

    auto report = batch_.run(inputRoot, intermediate);
    if (!report) {
        return std::unexpected(report.error());
    }

    getLogger()->info("Isolating {} meshes into {}", report->summary().succeeded, outputRoot.string());

    for (auto& record : report->records()) {
        if (record.outcome != StudyOutcome::Succeeded) continue;

        const auto finalPath = outputRoot / record.outputPath.filename();
        record.isolation = isolateOne(record.outputPath, finalPath);

        if (!keepIntermediate) {
            std::error_code ec;
            fs::remove(record.outputPath, ec);
            if (ec) {
                getLogger()->warn("Cannot remove {}: {}", record.outputPath.string(), ec.message());
            }
        }
    }

    if (!keepIntermediate) {
        std::error_code ec;
        if (fs::is_empty(intermediate, ec) && !ec) {
            fs::remove(intermediate, ec);
        }
    }

    report->logSummary(*getLogger());
    return report;
}

std::expected<RunReport, PipelineError>
TwoStageDriver::isolateDirectory(const fs::path& inputDir, const fs::path& outputDir) const
{
    std::error_code ec;
    fs::directory_iterator it(inputDir, ec);
    if (ec) {
        return std::unexpected(ioError("discover", "Cannot list " + inputDir.string() + ": " + ec.message()));
    }

    std::vector<fs::path> meshes;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(ioError("discover", "Cannot list " + inputDir.string() + ": " + ec.message()));
        }
        if (it->is_regular_file(ec) && detectFormat(it->path())) {
            meshes.push_back(it->path());
        }
    }
    std::sort(meshes.begin(), meshes.end());

    fs::create_directories(outputDir, ec);
    if (ec) {
        return std::unexpected(ioError("prepare_output", "Cannot create " + outputDir.string() + ": " + ec.message()));
    }

    RunReport report;
    for (const auto& mesh : meshes) {
        StudyRecord record;
        record.name = mesh.filename().string();
        record.path = mesh;
        record.outcome = StudyOutcome::Succeeded;
        record.outputPath = mesh;
        record.isolation = isolateOne(mesh, outputDir / mesh.filename());
        report.add(std::move(record));
    }

    report.logSummary(*getLogger());
    return report;
}

}  // namespace dicom_mesher::services
