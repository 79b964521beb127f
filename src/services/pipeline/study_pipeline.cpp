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

#include "services/pipeline/study_pipeline.hpp"

#include <chrono>
#include <cmath>
#include <format>
#include <fstream>
#include <random>
#include <system_error>

#include "core/dicom_loader.hpp"
#include "core/image_converter.hpp"
#include "core/logging.hpp"
#include "core/series_builder.hpp"
#include "core/zip_archive.hpp"
#include "services/mesh/mesh_finisher.hpp"
#include "services/preprocessing/volume_preprocessor.hpp"

namespace dicom_mesher::services {

namespace fs = std::filesystem;

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("StudyPipeline");
    return logger;
}

PipelineError ioError(const std::string& stage, const std::string& message)
{
    return PipelineError{PipelineError::Code::StudyIO, stage, message};
}

/**
 * @brief Uniquely named directory below the system temp directory,
 *        removed with its contents on destruction
 */
class ScopedTempDirectory {
public:
    ScopedTempDirectory() = default;
    ~ScopedTempDirectory()
    {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            getLogger()->warn("Cannot remove temporary directory {}: {}", path_.string(), ec.message());
        }
    }

    ScopedTempDirectory(const ScopedTempDirectory&) = delete;
    ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

    std::expected<fs::path, PipelineError> create()
    {
        std::error_code ec;
        const auto base = fs::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(ioError("extract_zip", "No temporary directory: " + ec.message()));
        }

        std::random_device device;
        std::mt19937_64 engine(device());
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto candidate = base / std::format("dicom_mesher_{:016x}", engine());
            if (fs::create_directory(candidate, ec)) {
                path_ = candidate;
                return path_;
            }
        }
        return std::unexpected(ioError("extract_zip", "Cannot create a temporary directory in " + base.string()));
    }

private:
    fs::path path_;
};

std::string roundThousandth(double value)
{
    return std::format("{}", std::round(value * 1000.0) / 1000.0);
}

std::expected<StudyVolume, PipelineError> loadDicomDirectory(const fs::path& dir, StudyInputKind kind)
{
    core::SeriesBuilder builder;
    auto loaded = builder.loadLargestSeries(dir);
    if (!loaded) {
        return std::unexpected(ioError("read_series", loaded.error().toString()));
    }

    StudyVolume study;
    study.volume = loaded->volume;
    study.kind = kind;
    study.modality = loaded->metadata.modality;
    study.sliceCount = loaded->sliceCount;
    return study;
}

}  // namespace

const char* toString(StudyInputKind kind) noexcept
{
    switch (kind) {
        case StudyInputKind::DicomDirectory: return "dicom_directory";
        case StudyInputKind::ZipArchive: return "zip_archive";
        case StudyInputKind::VolumeFile: return "volume_file";
    }
    return "unknown";
}

class StudyPipeline::Impl {
public:
    VolumePreprocessor preprocessor;
    MeshFinisher finisher;

    Impl(std::shared_ptr<const IVolumeFilters> filters,
         std::shared_ptr<const IMeshOperations> meshOperations)
        : preprocessor(std::move(filters))
        , finisher(std::move(meshOperations)) {}
};

StudyPipeline::StudyPipeline()
    : StudyPipeline(std::make_shared<ItkVolumeFilters>(), std::make_shared<VtkMeshOperations>()) {}

StudyPipeline::StudyPipeline(std::shared_ptr<const IVolumeFilters> filters,
                             std::shared_ptr<const IMeshOperations> meshOperations)
    : impl_(std::make_unique<Impl>(std::move(filters), std::move(meshOperations))) {}

StudyPipeline::~StudyPipeline() = default;

StudyPipeline::StudyPipeline(StudyPipeline&&) noexcept = default;
StudyPipeline& StudyPipeline::operator=(StudyPipeline&&) noexcept = default;

std::expected<StudyVolume, PipelineError>
StudyPipeline::loadStudy(const fs::path& input)
{
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        return std::unexpected(ioError("resolve_input", "Input does not exist: " + input.string()));
    }

    if (fs::is_directory(input, ec)) {
        return loadDicomDirectory(input, StudyInputKind::DicomDirectory);
    }

    if (core::ZipArchive::isZipFile(input)) {
        auto archive = core::ZipArchive::open(input);
        if (!archive) {
            return std::unexpected(ioError("extract_zip", std::format(
                "{}: {}", input.string(), core::toString(archive.error()))));
        }

        ScopedTempDirectory tempDir;
        auto dir = tempDir.create();
        if (!dir) {
            return std::unexpected(dir.error());
        }

        auto extracted = archive->extractAll(*dir);
        if (!extracted) {
            return std::unexpected(ioError("extract_zip", std::format(
                "{}: {}", input.string(), core::toString(extracted.error()))));
        }
        getLogger()->debug("Extracted {} files from {}", extracted->size(), input.string());

        // The volume is fully read before the directory goes away
        return loadDicomDirectory(*dir, StudyInputKind::ZipArchive);
    }

    core::DicomLoader loader;
    auto volume = loader.readVolumeFile(input);
    if (!volume) {
        return std::unexpected(ioError("read_volume", volume.error().toString()));
    }

    StudyVolume study;
    study.volume = *volume;
    study.kind = StudyInputKind::VolumeFile;
    if (core::DicomLoader::hasDicomExtension(input)) {
        auto metadata = loader.loadFile(input);
        if (metadata) {
            study.modality = metadata->modality;
        }
    }
    return study;
}

fs::path StudyPipeline::volumeInfoPathFor(const fs::path& meshPath)
{
    return meshPath.parent_path() / (meshPath.stem().string() + ".volume.txt");
}

std::expected<void, PipelineError>
StudyPipeline::writeVolumeInfo(const VolumeType* volume, const fs::path& path)
{
    if (volume == nullptr) {
        return std::unexpected(ioError("write_volume_info", "No volume"));
    }

    const auto size = volume->GetLargestPossibleRegion().GetSize();
    const auto spacing = volume->GetSpacing();

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return std::unexpected(ioError("write_volume_info", "Cannot open " + path.string()));
    }
    out << "xdimension " << size[0] << '\n'
        << "ydimension " << size[1] << '\n'
        << "zdimension " << size[2] << '\n'
        << "xspacing " << roundThousandth(spacing[0]) << '\n'
        << "yspacing " << roundThousandth(spacing[1]) << '\n'
        << "zspacing " << roundThousandth(spacing[2]) << '\n';
    if (!out) {
        return std::unexpected(ioError("write_volume_info", "Write failed: " + path.string()));
    }
    return {};
}

std::expected<StudyResult, PipelineError>
StudyPipeline::run(const fs::path& input,
                   const fs::path& outputPath,
                   const PipelineConfig& config) const
{
    const auto start = std::chrono::steady_clock::now();
    auto& logger = getLogger();

    auto study = loadStudy(input);
    if (!study) {
        return std::unexpected(study.error());
    }

    StudyResult result;
    result.inputKind = study->kind;
    result.modality = study->modality;
    const auto size = study->volume->GetLargestPossibleRegion().GetSize();
    const auto spacing = study->volume->GetSpacing();
    for (unsigned int i = 0; i < 3; ++i) {
        result.inputSize[i] = size[i];
        result.inputSpacing[i] = spacing[i];
    }
    logger->info("Loaded {} ({}): {}x{}x{} voxels, spacing {:.3f}x{:.3f}x{:.3f}, modality '{}'",
                 input.filename().string(), toString(study->kind),
                 size[0], size[1], size[2], spacing[0], spacing[1], spacing[2],
                 study->modality);

    if (config.requireCT && study->modality.find("CT") == std::string::npos) {
        return std::unexpected(ioError("modality_check", std::format(
            "Imaging modality '{}' is not CT", study->modality)));
    }

    auto prepared = impl_->preprocessor.preprocess(study->volume, config.preprocess);
    if (!prepared) {
        return std::unexpected(PipelineError{
            PipelineError::Code::Preprocess, prepared.error().stage, prepared.error().toString()});
    }

    auto meshInput = core::ImageConverter::toMeshInput(*prepared);
    if (!meshInput) {
        return std::unexpected(PipelineError{
            PipelineError::Code::Conversion, "convert", meshInput.error().toString()});
    }

    auto finished = impl_->finisher.finish(*meshInput, config.mesh, outputPath);
    if (!finished) {
        return std::unexpected(PipelineError{
            PipelineError::Code::MeshStage, toString(finished.error().stage), finished.error().message});
    }

    result.outputPath = finished->outputPath;
    result.statistics = finished->statistics;
    result.triangleCount = finished->statistics.triangleCount;

    if (config.writeVolumeInfo) {
        const auto infoPath = volumeInfoPathFor(outputPath);
        auto written = writeVolumeInfo(study->volume.GetPointer(), infoPath);
        if (!written) {
            // A failed study leaves no mesh behind
            std::error_code ec;
            fs::remove(finished->outputPath, ec);
            if (ec) {
                logger->warn("Cannot remove {}: {}", finished->outputPath.string(), ec.message());
            }
            return std::unexpected(written.error());
        }
        result.volumeInfoPath = infoPath;
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    logger->info("{} -> {} ({} triangles) in {:.1f}s",
                 input.filename().string(), outputPath.string(), result.triangleCount,
                 elapsed.count());
    return result;
}

}  // namespace dicom_mesher::services
