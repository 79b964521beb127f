#pragma once

#include <expected>
#include <filesystem>
#include <memory>

#include "services/mesh/object_isolator.hpp"
#include "services/pipeline/batch_controller.hpp"
#include "services/pipeline/run_report.hpp"

namespace dicom_mesher::services {

/**
 * @brief Batch conversion followed by object isolation
 *
 * Meshes are first written to `<outputRoot>/intermediate`; each succeeded
 * study is then isolated into `<outputRoot>/<same file name>`. A failed
 * isolation is recorded on the study and does not stop the run.
 */
class TwoStageDriver {
public:
    TwoStageDriver(BatchController batch,
                   std::shared_ptr<const ObjectIsolator> isolator = std::make_shared<ObjectIsolator>());

    /**
     * @param keepIntermediate Keep the first-stage meshes; otherwise each is
     *        deleted after isolation and the intermediate directory is
     *        removed once empty
     */
    [[nodiscard]] std::expected<RunReport, PipelineError>
    run(const std::filesystem::path& inputRoot,
        const std::filesystem::path& outputRoot,
        bool keepIntermediate) const;

    /**
     * @brief Isolate every mesh file of @p inputDir into @p outputDir
     *
     * One record per mesh file, in name order, with the isolation outcome
     * filled in.
     */
    [[nodiscard]] std::expected<RunReport, PipelineError>
    isolateDirectory(const std::filesystem::path& inputDir,
                     const std::filesystem::path& outputDir) const;

    [[nodiscard]] static std::filesystem::path
    intermediateDirectory(const std::filesystem::path& outputRoot);

private:
    [[nodiscard]] IsolationRecord isolateOne(const std::filesystem::path& meshPath,
                                             const std::filesystem::path& outputPath) const;

    BatchController batch_;
    std::shared_ptr<const ObjectIsolator> isolator_;
};

}  // namespace dicom_mesher::services
