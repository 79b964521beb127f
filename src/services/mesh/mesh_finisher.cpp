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

#include "services/mesh/mesh_finisher.hpp"

#include "core/logging.hpp"
#include "services/mesh/mesh_io.hpp"

namespace dicom_mesher::services {

class MeshFinisher::Impl {
public:
    std::shared_ptr<const IMeshOperations> operations;
    StageCallback stageCallback;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(std::shared_ptr<const IMeshOperations> ops)
        : operations(std::move(ops))
        , logger(logging::LoggerFactory::create("MeshFinisher")) {}

    void enterStage(MeshStage stage) const {
        if (stageCallback) {
            stageCallback(stage);
        }
        logger->debug("Mesh stage: {}", toString(stage));
    }
};

MeshFinisher::MeshFinisher()
    : MeshFinisher(std::make_shared<VtkMeshOperations>()) {}

MeshFinisher::MeshFinisher(std::shared_ptr<const IMeshOperations> operations)
    : impl_(std::make_unique<Impl>(std::move(operations))) {}

MeshFinisher::~MeshFinisher() = default;

MeshFinisher::MeshFinisher(MeshFinisher&&) noexcept = default;
MeshFinisher& MeshFinisher::operator=(MeshFinisher&&) noexcept = default;

void MeshFinisher::setStageCallback(StageCallback callback)
{
    impl_->stageCallback = std::move(callback);
}

std::expected<MeshFinishResult, MeshStageError>
MeshFinisher::finish(const core::MeshInput& input,
                     const MeshOptions& options,
                     const std::filesystem::path& outputPath) const
{
    if (!options.isValid()) {
        return std::unexpected(MeshStageError{
            MeshStage::Extract, "Invalid mesh options"});
    }
    if (!detectFormat(outputPath)) {
        return std::unexpected(MeshStageError{
            MeshStage::Write, "Unsupported mesh extension: " + outputPath.string()});
    }

    const auto& ops = *impl_->operations;
    MeshFinishResult result;
    result.outputPath = outputPath;

    impl_->enterStage(MeshStage::Extract);
    auto mesh = ops.extract(input, options.isoValue);
    if (!mesh) return std::unexpected(mesh.error());
    result.extractedTriangles = static_cast<size_t>((*mesh)->GetNumberOfPolys());
    impl_->logger->info("Extracted iso-surface at {:.1f}: {} triangles",
                        options.isoValue, result.extractedTriangles);

    impl_->enterStage(MeshStage::Clean);
    mesh = ops.clean(*mesh, options.keepLargestRegion);
    if (!mesh) return std::unexpected(mesh.error());
    result.cleanedTriangles = static_cast<size_t>((*mesh)->GetNumberOfPolys());

    if (options.smoothingIterations > 0) {
        impl_->enterStage(MeshStage::Smooth);
        mesh = ops.smooth(*mesh, options.smoothingIterations, options.smoothingPassBand);
        if (!mesh) return std::unexpected(mesh.error());
    }

    if (options.decimationReduction > 0.0) {
        impl_->enterStage(MeshStage::Decimate);
        mesh = ops.decimate(*mesh, options.decimationReduction);
        if (!mesh) return std::unexpected(mesh.error());

        const auto decimatedTriangles = static_cast<size_t>((*mesh)->GetNumberOfPolys());
        if (decimatedTriangles > result.cleanedTriangles) {
            return std::unexpected(MeshStageError{
                MeshStage::Decimate,
                "Decimation increased the triangle count"});
        }
    }

    if (options.rotation) {
        impl_->enterStage(MeshStage::Rotate);
        mesh = ops.rotate(*mesh, *options.rotation);
        if (!mesh) return std::unexpected(mesh.error());
    }

    impl_->enterStage(MeshStage::Write);
    auto written = ops.write(*mesh, outputPath, options.stlFormat);
    if (!written) return std::unexpected(written.error());

    result.statistics = computeStatistics(*mesh);
    impl_->logger->info("Wrote {}: {} vertices, {} triangles, {:.2f} mm² surface area",
                        outputPath.string(), result.statistics.vertexCount,
                        result.statistics.triangleCount, result.statistics.surfaceAreaMm2);
    return result;
}

}  // namespace dicom_mesher::services
