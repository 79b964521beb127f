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

#include "core/zip_archive.hpp"

#include <fstream>
#include <zlib.h>

namespace dicom_mesher::core {

namespace {

constexpr uint32_t kLocalFileHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralDirHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr uint16_t kCompressionStore = 0;
constexpr uint16_t kCompressionDeflate = 8;

constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kCentralDirHeaderSize = 46;
constexpr size_t kLocalFileHeaderSize = 30;

// Read a little-endian integer from a buffer at offset
template <typename T>
T readLE(const uint8_t* data, size_t offset) {
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result |= static_cast<T>(static_cast<T>(data[offset + i]) << (i * 8));
    }
    return result;
}

std::expected<std::vector<uint8_t>, ZipError>
inflateRaw(const uint8_t* input, size_t inputSize, size_t originalSize) {
    std::vector<uint8_t> output(originalSize);
    if (originalSize == 0) {
        return output;
    }

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input);
    stream.avail_in = static_cast<uInt>(inputSize);
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    // Raw inflate (-MAX_WBITS): ZIP entries carry no zlib header
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return std::unexpected(ZipError::DecompressionFailed);
    }

    int ret = inflate(&stream, Z_FINISH);
    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return std::unexpected(ZipError::DecompressionFailed);
    }

    output.resize(stream.total_out);
    return output;
}

bool isSafeEntryName(const std::string& name) {
    std::filesystem::path entryPath(name);
    if (entryPath.empty() || entryPath.is_absolute() || entryPath.has_root_name()) {
        return false;
    }
    for (const auto& part : entryPath) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

}  // namespace

const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::FileOpenFailed: return "cannot open archive";
        case ZipError::FileWriteFailed: return "cannot write extracted file";
        case ZipError::FileReadFailed: return "cannot read archive";
        case ZipError::DecompressionFailed: return "decompression failed";
        case ZipError::InvalidArchive: return "invalid archive";
        case ZipError::UnsafeEntryName: return "entry escapes extraction directory";
        case ZipError::UnsupportedCompression: return "unsupported compression method";
        case ZipError::EntryNotFound: return "entry not found";
    }
    return "unknown zip error";
}

std::expected<ZipArchive, ZipError>
ZipArchive::open(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::unexpected(ZipError::FileOpenFailed);
    }

    auto fileSize = file.tellg();
    file.seekg(0);

    ZipArchive archive;
    archive.data_.resize(static_cast<size_t>(fileSize));
    file.read(reinterpret_cast<char*>(archive.data_.data()),
              static_cast<std::streamsize>(fileSize));
    if (!file) {
        return std::unexpected(ZipError::FileReadFailed);
    }

    const auto& data = archive.data_;
    if (data.size() < kEndOfCentralDirSize) {
        return std::unexpected(ZipError::InvalidArchive);
    }

    // The end record sits before an optional trailing comment
    size_t eocdOffset = data.size() - kEndOfCentralDirSize;
    while (readLE<uint32_t>(data.data(), eocdOffset) != kEndOfCentralDirSignature) {
        if (eocdOffset == 0) {
            return std::unexpected(ZipError::InvalidArchive);
        }
        --eocdOffset;
    }

    const uint16_t entryCount = readLE<uint16_t>(data.data(), eocdOffset + 10);
    size_t offset = readLE<uint32_t>(data.data(), eocdOffset + 16);

    archive.entries_.reserve(entryCount);
    for (uint16_t i = 0; i < entryCount; ++i) {
        if (offset + kCentralDirHeaderSize > data.size() ||
            readLE<uint32_t>(data.data(), offset) != kCentralDirHeaderSignature) {
            return std::unexpected(ZipError::InvalidArchive);
        }

        Entry entry;
        entry.compressionMethod = readLE<uint16_t>(data.data(), offset + 10);
        entry.crc32 = readLE<uint32_t>(data.data(), offset + 16);
        entry.compressedSize = readLE<uint32_t>(data.data(), offset + 20);
        entry.uncompressedSize = readLE<uint32_t>(data.data(), offset + 24);
        const uint16_t nameLen = readLE<uint16_t>(data.data(), offset + 28);
        const uint16_t extraLen = readLE<uint16_t>(data.data(), offset + 30);
        const uint16_t commentLen = readLE<uint16_t>(data.data(), offset + 32);
        entry.localHeaderOffset = readLE<uint32_t>(data.data(), offset + 42);

        if (offset + kCentralDirHeaderSize + nameLen > data.size()) {
            return std::unexpected(ZipError::InvalidArchive);
        }
        entry.name.assign(
            reinterpret_cast<const char*>(data.data() + offset + kCentralDirHeaderSize),
            nameLen);

        archive.entries_.push_back(std::move(entry));
        offset += kCentralDirHeaderSize + nameLen + extraLen + commentLen;
    }

    return archive;
}

bool ZipArchive::isZipFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    uint8_t signature[4] = {};
    file.read(reinterpret_cast<char*>(signature), sizeof(signature));
    return file.gcount() == 4 &&
           readLE<uint32_t>(signature, 0) == kLocalFileHeaderSignature;
}

std::vector<std::string> ZipArchive::entryNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

std::expected<std::vector<uint8_t>, ZipError>
ZipArchive::readEntry(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return inflateEntry(entry);
        }
    }
    return std::unexpected(ZipError::EntryNotFound);
}

std::expected<std::vector<uint8_t>, ZipError>
ZipArchive::inflateEntry(const Entry& entry) const {
    const size_t local = entry.localHeaderOffset;
    if (local + kLocalFileHeaderSize > data_.size() ||
        readLE<uint32_t>(data_.data(), local) != kLocalFileHeaderSignature) {
        return std::unexpected(ZipError::InvalidArchive);
    }

    const uint16_t localNameLen = readLE<uint16_t>(data_.data(), local + 26);
    const uint16_t localExtraLen = readLE<uint16_t>(data_.data(), local + 28);
    const size_t dataStart = local + kLocalFileHeaderSize + localNameLen + localExtraLen;
    if (dataStart + entry.compressedSize > data_.size()) {
        return std::unexpected(ZipError::InvalidArchive);
    }

    std::vector<uint8_t> content;
    if (entry.compressionMethod == kCompressionStore) {
        content.assign(data_.begin() + static_cast<ptrdiff_t>(dataStart),
                       data_.begin() + static_cast<ptrdiff_t>(dataStart + entry.compressedSize));
    } else if (entry.compressionMethod == kCompressionDeflate) {
        auto inflated = inflateRaw(data_.data() + dataStart, entry.compressedSize,
                                   entry.uncompressedSize);
        if (!inflated) {
            return std::unexpected(inflated.error());
        }
        content = std::move(*inflated);
    } else {
        return std::unexpected(ZipError::UnsupportedCompression);
    }

    const auto actualCrc = static_cast<uint32_t>(
        ::crc32(0L, content.data(), static_cast<uInt>(content.size())));
    if (actualCrc != entry.crc32) {
        return std::unexpected(ZipError::InvalidArchive);
    }

    return content;
}

std::expected<std::vector<std::filesystem::path>, ZipError>
ZipArchive::extractAll(const std::filesystem::path& destination) const {
    for (const auto& entry : entries_) {
        if (!isSafeEntryName(entry.name)) {
            return std::unexpected(ZipError::UnsafeEntryName);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(ZipError::FileWriteFailed);
    }

    std::vector<std::filesystem::path> extracted;
    for (const auto& entry : entries_) {
        const auto target = destination / std::filesystem::path(entry.name);

        if (entry.isDirectory()) {
            std::filesystem::create_directories(target, ec);
            if (ec) {
                return std::unexpected(ZipError::FileWriteFailed);
            }
            continue;
        }

        auto content = inflateEntry(entry);
        if (!content) {
            return std::unexpected(content.error());
        }

        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return std::unexpected(ZipError::FileWriteFailed);
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content->data()),
                  static_cast<std::streamsize>(content->size()));
        if (!out) {
            return std::unexpected(ZipError::FileWriteFailed);
        }
        extracted.push_back(target);
    }

    return extracted;
}

} // namespace dicom_mesher::core
