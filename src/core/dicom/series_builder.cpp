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

#include "core/series_builder.hpp"

#include <algorithm>

#include "core/logging.hpp"

namespace dicom_mesher::core {

class SeriesBuilder::Impl {
public:
    DicomLoader loader;
    std::shared_ptr<spdlog::logger> logger;

    Impl() : logger(logging::LoggerFactory::create("SeriesBuilder")) {}
};

SeriesBuilder::SeriesBuilder()
    : impl_(std::make_unique<Impl>())
{
}

SeriesBuilder::~SeriesBuilder() = default;

SeriesBuilder::SeriesBuilder(SeriesBuilder&&) noexcept = default;
SeriesBuilder& SeriesBuilder::operator=(SeriesBuilder&&) noexcept = default;

std::expected<std::vector<SeriesInfo>, DicomErrorInfo>
SeriesBuilder::scanForSeries(const std::filesystem::path& directoryPath)
{
    impl_->logger->debug("Scanning for series in: {}", directoryPath.string());

    auto scanResult = impl_->loader.scanDirectory(directoryPath, true);
    if (!scanResult) {
        return std::unexpected(scanResult.error());
    }

    std::vector<SeriesInfo> seriesInfoList;
    for (const auto& [uid, series] : scanResult.value()) {
        SeriesInfo info;
        info.seriesInstanceUid = uid;
        info.files = series.files;
        info.sliceCount = series.files.size();

        if (!series.files.empty()) {
            auto metaResult = impl_->loader.loadFile(series.files.front());
            if (metaResult) {
                info.modality = metaResult->modality;
            }
        }

        seriesInfoList.push_back(std::move(info));
    }

    std::stable_sort(seriesInfoList.begin(), seriesInfoList.end(),
        [](const SeriesInfo& a, const SeriesInfo& b) {
            return a.sliceCount > b.sliceCount;
        });

    impl_->logger->debug("Found {} series in {}", seriesInfoList.size(), directoryPath.string());
    return seriesInfoList;
}

std::expected<LoadedSeries, DicomErrorInfo>
SeriesBuilder::buildVolume(const SeriesInfo& series)
{
    if (series.files.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            "No slices in series " + series.seriesInstanceUid
        });
    }

    impl_->logger->info("Reading series {} ({} slices)",
                        series.seriesInstanceUid, series.sliceCount);

    auto metadata = impl_->loader.loadFile(series.files.front());
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    auto volume = impl_->loader.loadSeries(series.files);
    if (!volume) {
        impl_->logger->error("Failed to build volume: {}", volume.error().message);
        return std::unexpected(volume.error());
    }

    LoadedSeries loaded;
    loaded.volume = volume.value();
    loaded.metadata = std::move(metadata.value());
    loaded.sliceCount = series.sliceCount;
    return loaded;
}

std::expected<LoadedSeries, DicomErrorInfo>
SeriesBuilder::loadLargestSeries(const std::filesystem::path& directoryPath)
{
    auto series = scanForSeries(directoryPath);
    if (!series) {
        return std::unexpected(series.error());
    }

    const auto* largest = selectLargest(series.value());
    if (largest == nullptr) {
        return std::unexpected(DicomErrorInfo{
            DicomError::NoSeriesFound,
            directoryPath.string()
        });
    }

    if (series->size() > 1) {
        impl_->logger->info("{} series found, using {} with {} slices",
                            series->size(), largest->seriesInstanceUid, largest->sliceCount);
    }
    return buildVolume(*largest);
}

const SeriesInfo* SeriesBuilder::selectLargest(const std::vector<SeriesInfo>& series)
{
    const SeriesInfo* best = nullptr;
    for (const auto& candidate : series) {
        if (best == nullptr ||
            candidate.sliceCount > best->sliceCount ||
            (candidate.sliceCount == best->sliceCount &&
             candidate.seriesInstanceUid < best->seriesInstanceUid)) {
            best = &candidate;
        }
    }
    return best;
}

} // namespace dicom_mesher::core
