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

#include "core/dicom_loader.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <itkGDCMImageIO.h>
#include <itkGDCMSeriesFileNames.h>
#include <itkImageFileReader.h>
#include <itkImageSeriesReader.h>
#include <itkMetaDataObject.h>

#include "core/logging.hpp"

namespace dicom_mesher::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DicomLoader");
    return logger;
}

std::string trimmed(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c) && c != '\0'; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

}  // namespace

class DicomLoader::Impl {
public:
    itk::GDCMImageIO::Pointer gdcmIO;

    Impl() : gdcmIO(itk::GDCMImageIO::New()) {}
};

DicomLoader::DicomLoader() : impl_(std::make_unique<Impl>()) {}

DicomLoader::~DicomLoader() = default;

DicomLoader::DicomLoader(DicomLoader&&) noexcept = default;
DicomLoader& DicomLoader::operator=(DicomLoader&&) noexcept = default;

std::expected<DicomMetadata, DicomErrorInfo>
DicomLoader::loadFile(const std::filesystem::path& filePath)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            filePath.string()
        });
    }

    try {
        auto io = itk::GDCMImageIO::New();
        io->SetFileName(filePath.string());
        if (!io->CanReadFile(filePath.string().c_str())) {
            return std::unexpected(DicomErrorInfo{
                DicomError::InvalidDicomFormat,
                "Not a readable DICOM file: " + filePath.string()
            });
        }
        io->ReadImageInformation();

        const auto& dictionary = io->GetMetaDataDictionary();

        auto getString = [&dictionary](const std::string& key) -> std::string {
            std::string value;
            itk::ExposeMetaData<std::string>(dictionary, key, value);
            return trimmed(value);
        };

        DicomMetadata metadata;
        metadata.patientId = getString("0010|0020");
        metadata.studyInstanceUid = getString("0020|000d");
        metadata.seriesInstanceUid = getString("0020|000e");
        metadata.modality = getString("0008|0060");
        metadata.bodyPartExamined = getString("0018|0015");

        return metadata;

    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            filePath.string() + ": " + e.GetDescription()
        });
    }
}

std::expected<std::map<std::string, SliceSeries>, DicomErrorInfo>
DicomLoader::scanDirectory(const std::filesystem::path& directoryPath, bool recursive)
{
    if (!std::filesystem::is_directory(directoryPath)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            "Directory not found: " + directoryPath.string()
        });
    }

    try {
        auto namesGenerator = itk::GDCMSeriesFileNames::New();
        namesGenerator->SetUseSeriesDetails(true);
        namesGenerator->SetRecursive(recursive);
        namesGenerator->SetDirectory(directoryPath.string());

        std::map<std::string, SliceSeries> seriesMap;

        for (const auto& uid : namesGenerator->GetSeriesUIDs()) {
            SliceSeries series;
            series.seriesInstanceUid = uid;
            for (const auto& fileName : namesGenerator->GetFileNames(uid)) {
                series.files.emplace_back(fileName);
            }
            getLogger()->debug("Series {}: {} slices", uid, series.files.size());
            seriesMap.emplace(uid, std::move(series));
        }

        if (seriesMap.empty()) {
            return std::unexpected(DicomErrorInfo{
                DicomError::NoSeriesFound,
                directoryPath.string()
            });
        }

        return seriesMap;

    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            std::string("Failed to scan directory: ") + e.GetDescription()
        });
    }
}

std::expected<VolumeType::Pointer, DicomErrorInfo>
DicomLoader::loadSeries(const std::vector<std::filesystem::path>& files)
{
    if (files.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            "No slices provided"
        });
    }

    try {
        std::vector<std::string> fileNames;
        fileNames.reserve(files.size());
        for (const auto& file : files) {
            fileNames.push_back(file.string());
        }

        using ReaderType = itk::ImageSeriesReader<VolumeType>;
        auto reader = ReaderType::New();
        reader->SetImageIO(impl_->gdcmIO);
        reader->SetFileNames(fileNames);
        reader->Update();

        VolumeType::Pointer volume = reader->GetOutput();
        volume->DisconnectPipeline();
        return volume;

    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            std::string("Failed to read series: ") + e.GetDescription()
        });
    }
}

std::expected<VolumeType::Pointer, DicomErrorInfo>
DicomLoader::readVolumeFile(const std::filesystem::path& filePath)
{
    if (!std::filesystem::is_regular_file(filePath)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            filePath.string()
        });
    }

    try {
        using ReaderType = itk::ImageFileReader<VolumeType>;
        auto reader = ReaderType::New();
        reader->SetFileName(filePath.string());
        reader->Update();

        VolumeType::Pointer volume = reader->GetOutput();
        volume->DisconnectPipeline();
        return volume;

    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::VolumeReadFailed,
            filePath.string() + ": " + e.GetDescription()
        });
    }
}

bool DicomLoader::hasDicomExtension(const std::filesystem::path& filePath)
{
    auto ext = filePath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".dcm";
}

} // namespace dicom_mesher::core
