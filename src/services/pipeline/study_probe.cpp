#include "services/pipeline/study_probe.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace fs = std::filesystem;

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("StudyProbe");
    return logger;
}

std::expected<std::vector<fs::path>, PipelineError> listSlices(const fs::path& dir)
{
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "probe", "Cannot list " + dir.string() + ": " + ec.message()});
    }

    std::vector<fs::path> slices;
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(PipelineError{
                PipelineError::Code::StudyIO, "probe", "Cannot list " + dir.string() + ": " + ec.message()});
        }
        if (it->is_regular_file(ec) && core::DicomLoader::hasDicomExtension(it->path())) {
            slices.push_back(it->path());
        }
    }
    std::sort(slices.begin(), slices.end());
    return slices;
}

}  // namespace

std::expected<size_t, PipelineError> DicomStudyProbe::countSlices(const fs::path& dir)
{
    auto slices = listSlices(dir);
    if (!slices) {
        return std::unexpected(slices.error());
    }
    return slices->size();
}

std::optional<std::string> DicomStudyProbe::patientKeyFor(const core::DicomMetadata& metadata)
{
    if (!metadata.patientId.empty()) {
        return "patient:" + metadata.patientId;
    }
    if (!metadata.studyInstanceUid.empty()) {
        return "study:" + metadata.studyInstanceUid;
    }
    return std::nullopt;
}

std::expected<StudyProbeResult, PipelineError>
DicomStudyProbe::probe(const fs::path& studyDir, bool readPatientKey) const
{
    auto slices = listSlices(studyDir);
    if (!slices) {
        return std::unexpected(slices.error());
    }

    StudyProbeResult result;
    result.sliceCount = slices->size();
    if (!readPatientKey) {
        return result;
    }

    core::DicomLoader loader;
    for (const auto& slice : *slices) {
        auto metadata = loader.loadFile(slice);
        if (!metadata) {
            getLogger()->debug("Skipping unreadable header {}: {}",
                               slice.string(), metadata.error().toString());
            continue;
        }
        result.patientKey = patientKeyFor(*metadata);
        break;
    }

    if (!result.patientKey) {
        getLogger()->warn("{}: no PatientID or StudyInstanceUID found, study is never treated as a duplicate",
                          studyDir.filename().string());
    }
    return result;
}

}  // namespace dicom_mesher::services
