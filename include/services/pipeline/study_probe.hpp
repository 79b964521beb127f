#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "core/dicom_loader.hpp"
#include "services/pipeline_error.hpp"

namespace dicom_mesher::services {

struct StudyProbeResult {
    size_t sliceCount = 0;
    std::optional<std::string> patientKey;  ///< Only read when requested
};

/**
 * @brief Cheap look at a study directory ahead of conversion
 */
class IStudyProbe {
public:
    virtual ~IStudyProbe() = default;

    [[nodiscard]] virtual std::expected<StudyProbeResult, PipelineError>
    probe(const std::filesystem::path& studyDir, bool readPatientKey) const = 0;
};

/**
 * @brief Probe counting `.dcm` files and reading the patient identity from
 *        the first readable slice header
 */
class DicomStudyProbe : public IStudyProbe {
public:
    [[nodiscard]] std::expected<StudyProbeResult, PipelineError>
    probe(const std::filesystem::path& studyDir, bool readPatientKey) const override;

    /// Number of files with a `.dcm` extension (any case) below @p dir
    [[nodiscard]] static std::expected<size_t, PipelineError>
    countSlices(const std::filesystem::path& dir);

    /**
     * @brief Identity used for deduplication
     * @return "patient:<PatientID>", else "study:<StudyInstanceUID>", else nullopt
     */
    [[nodiscard]] static std::optional<std::string>
    patientKeyFor(const core::DicomMetadata& metadata);
};

}  // namespace dicom_mesher::services
