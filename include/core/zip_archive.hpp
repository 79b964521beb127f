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

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace dicom_mesher::core {

/**
 * @brief Error codes for ZIP operations
 */
enum class ZipError {
    FileOpenFailed,
    FileWriteFailed,
    FileReadFailed,
    DecompressionFailed,
    InvalidArchive,
    UnsafeEntryName,
    UnsupportedCompression,
    EntryNotFound
};

[[nodiscard]] const char* toString(ZipError error) noexcept;

/**
 * @brief Read-only ZIP archive backed by system zlib
 *
 * Used to unpack zipped DICOM studies. The central directory is parsed
 * on open; entry data is inflated on demand. Stored and DEFLATE entries
 * are supported.
 *
 * @code
 * auto zip = ZipArchive::open("/data/study.zip");
 * if (zip) {
 *     auto files = zip->extractAll(scratchDir);
 * }
 * @endcode
 */
class ZipArchive {
public:
    struct Entry {
        std::string name;
        uint16_t compressionMethod = 0;
        uint32_t crc32 = 0;
        uint32_t compressedSize = 0;
        uint32_t uncompressedSize = 0;
        uint32_t localHeaderOffset = 0;

        [[nodiscard]] bool isDirectory() const noexcept {
            return !name.empty() && name.back() == '/';
        }
    };

    /**
     * @brief Open an archive and read its central directory
     */
    [[nodiscard]] static std::expected<ZipArchive, ZipError>
    open(const std::filesystem::path& path);

    /// Whether the file starts with a ZIP local header signature
    [[nodiscard]] static bool isZipFile(const std::filesystem::path& path);

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

    [[nodiscard]] std::vector<std::string> entryNames() const;

    /**
     * @brief Inflate a single entry (CRC-checked)
     */
    [[nodiscard]] std::expected<std::vector<uint8_t>, ZipError>
    readEntry(const std::string& name) const;

    /**
     * @brief Extract every file entry below @p destination
     *
     * Entry names that are absolute or climb out of the destination with
     * ".." are rejected before anything is written.
     *
     * @return Paths of the extracted files
     */
    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, ZipError>
    extractAll(const std::filesystem::path& destination) const;

private:
    ZipArchive() = default;

    [[nodiscard]] std::expected<std::vector<uint8_t>, ZipError>
    inflateEntry(const Entry& entry) const;

    std::vector<uint8_t> data_;
    std::vector<Entry> entries_;
};

} // namespace dicom_mesher::core
