/**
 * @file study_organizer.hpp
 * @brief Sorting of a flat DICOM drop folder into per-series directories
 * @details Files whose modality and body part match the filter are moved
 *          to `<outputDir>/<SeriesInstanceUID>/<file name>`, which is the
 *          layout the batch controller expects. A JSON ledger of file names
 *          already looked at makes reruns over a growing folder incremental.
 */

#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <set>
#include <string>

#include "core/dicom_loader.hpp"
#include "services/pipeline_error.hpp"

namespace dicom_mesher::services {

struct OrganizeOptions {
    std::string modality = "CT";
    std::string bodyPart = "HEAD";

    /// Treat each immediate subdirectory of the source as a drop folder
    bool recurseSubdirectories = false;

    /// Ledger file; empty means `<outputDir>/organized_dcms.json`
    std::filesystem::path ledgerPath;
};

struct OrganizeSummary {
    size_t examined = 0;        ///< Files not yet in the ledger
    size_t moved = 0;
    size_t filteredOut = 0;     ///< Readable, but modality or body part differ
    size_t errors = 0;          ///< Unreadable or not movable
    std::set<std::string> seriesUids;
};

class StudyOrganizer {
public:
    using MetadataReader = std::function<std::expected<core::DicomMetadata, core::DicomErrorInfo>(
        const std::filesystem::path& file)>;

    /// Reads headers with core::DicomLoader
    explicit StudyOrganizer(OrganizeOptions options);
    StudyOrganizer(OrganizeOptions options, MetadataReader reader);

    /**
     * @brief Move the matching files of @p sourceDir below @p outputDir
     * @return Counts; an error only when a directory cannot be listed or
     *         the ledger cannot be read or written
     */
    [[nodiscard]] std::expected<OrganizeSummary, PipelineError>
    organize(const std::filesystem::path& sourceDir,
             const std::filesystem::path& outputDir) const;

    [[nodiscard]] std::filesystem::path
    ledgerPathFor(const std::filesystem::path& outputDir) const;

    [[nodiscard]] static std::expected<std::set<std::string>, PipelineError>
    loadLedger(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<void, PipelineError>
    saveLedger(const std::filesystem::path& path, const std::set<std::string>& names);

private:
    [[nodiscard]] std::expected<void, PipelineError>
    organizeFolder(const std::filesystem::path& folder,
                   const std::filesystem::path& outputDir,
                   std::set<std::string>& ledger,
                   OrganizeSummary& summary) const;

    OrganizeOptions options_;
    MetadataReader reader_;
};

}  // namespace dicom_mesher::services
