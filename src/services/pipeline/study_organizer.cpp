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

#include "services/pipeline/study_organizer.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace fs = std::filesystem;

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("StudyOrganizer");
    return logger;
}

PipelineError ioError(const std::string& stage, const std::string& message)
{
    return PipelineError{PipelineError::Code::StudyIO, stage, message};
}

std::expected<std::vector<fs::path>, PipelineError>
listEntries(const fs::path& dir, bool directories)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(ioError("organize", "Cannot list " + dir.string() + ": " + ec.message()));
    }

    std::vector<fs::path> entries;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(ioError("organize", "Cannot list " + dir.string() + ": " + ec.message()));
        }
        const bool match = directories ? it->is_directory(ec) : it->is_regular_file(ec);
        if (match) {
            entries.push_back(it->path());
        }
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

/// rename, falling back to copy + remove across file systems
std::error_code moveFile(const fs::path& from, const fs::path& to)
{
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return ec;
    }
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return ec;
    }
    fs::remove(from, ec);
    return ec;
}

}  // namespace

StudyOrganizer::StudyOrganizer(OrganizeOptions options)
    : StudyOrganizer(std::move(options), [](const fs::path& file) {
          core::DicomLoader loader;
          return loader.loadFile(file);
      })
{
}

StudyOrganizer::StudyOrganizer(OrganizeOptions options, MetadataReader reader)
    : options_(std::move(options))
    , reader_(std::move(reader))
{
}

fs::path StudyOrganizer::ledgerPathFor(const fs::path& outputDir) const
{
    return options_.ledgerPath.empty() ? outputDir / "organized_dcms.json" : options_.ledgerPath;
}

std::expected<std::set<std::string>, PipelineError>
StudyOrganizer::loadLedger(const fs::path& path)
{
    std::set<std::string> names;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return names;
    }

    std::ifstream in(path);
    if (!in) {
        return std::unexpected(ioError("read_ledger", "Cannot open " + path.string()));
    }
    try {
        auto j = nlohmann::json::parse(in);
        for (const auto& name : j) {
            names.insert(name.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ioError("read_ledger", path.string() + ": " + e.what()));
    }
    return names;
}

std::expected<void, PipelineError>
StudyOrganizer::saveLedger(const fs::path& path, const std::set<std::string>& names)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return std::unexpected(ioError("write_ledger", "Cannot open " + path.string()));
    }
    nlohmann::json j = nlohmann::json::array();
    for (const auto& name : names) {
        j.push_back(name);
    }
    out << j.dump() << '\n';
    if (!out) {
        return std::unexpected(ioError("write_ledger", "Write failed: " + path.string()));
    }
    return {};
}

std::expected<void, PipelineError>
StudyOrganizer::organizeFolder(const fs::path& folder,
                               const fs::path& outputDir,
                               std::set<std::string>& ledger,
                               OrganizeSummary& summary) const
{
    auto files = listEntries(folder, false);
    if (!files) {
        return std::unexpected(files.error());
    }

    std::vector<std::string> looked;
    for (const auto& file : *files) {
        const auto name = file.filename().string();
        if (ledger.contains(name)) continue;

        ++summary.examined;
        looked.push_back(name);

        auto metadata = reader_(file);
        if (!metadata) {
            ++summary.errors;
            getLogger()->warn("Error processing file {}: {}", name, metadata.error().toString());
            continue;
        }
        if (metadata->modality != options_.modality || metadata->bodyPartExamined != options_.bodyPart) {
            ++summary.filteredOut;
            continue;
        }
        if (metadata->seriesInstanceUid.empty()) {
            ++summary.errors;
            getLogger()->warn("Error processing file {}: no SeriesInstanceUID", name);
            continue;
        }

        const auto seriesDir = outputDir / metadata->seriesInstanceUid;
        std::error_code ec;
        fs::create_directories(seriesDir, ec);
        if (!ec) {
            ec = moveFile(file, seriesDir / file.filename());
        }
        if (ec) {
            ++summary.errors;
            getLogger()->warn("Error moving file {}: {}", name, ec.message());
            continue;
        }
        ++summary.moved;
        summary.seriesUids.insert(metadata->seriesInstanceUid);
    }

    ledger.insert(looked.begin(), looked.end());
    return {};
}

std::expected<OrganizeSummary, PipelineError>
StudyOrganizer::organize(const fs::path& sourceDir, const fs::path& outputDir) const
{
    const auto ledgerPath = ledgerPathFor(outputDir);
    auto ledger = loadLedger(ledgerPath);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }
    getLogger()->info("Organizing {} ({} files already in ledger), filter {}/{}",
                      sourceDir.string(), ledger->size(), options_.modality, options_.bodyPart);

    OrganizeSummary summary;
    if (options_.recurseSubdirectories) {
        auto folders = listEntries(sourceDir, true);
        if (!folders) {
            return std::unexpected(folders.error());
        }
        for (const auto& folder : *folders) {
            if (folder == outputDir) continue;
            auto done = organizeFolder(folder, outputDir, *ledger, summary);
            if (!done) {
                return std::unexpected(done.error());
            }
        }
    } else {
        auto done = organizeFolder(sourceDir, outputDir, *ledger, summary);
        if (!done) {
            return std::unexpected(done.error());
        }
    }

    auto saved = saveLedger(ledgerPath, *ledger);
    if (!saved) {
        return std::unexpected(saved.error());
    }

    getLogger()->info("{} files organized into {} series directories, {} errors",
                      summary.moved, summary.seriesUids.size(), summary.errors);
    return summary;
}

}  // namespace dicom_mesher::services
