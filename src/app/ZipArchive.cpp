#include "ZipArchive.hpp"

#include <algorithm>
#include <format>
#include <limits>

#include <zlib.h>

namespace motionlib {

namespace {
    constexpr uint32_t kEndOfCentralDirectory = 0x06054b50;
    constexpr uint32_t kZip64EndOfCentralDirectory = 0x06064b50;
    constexpr uint32_t kZip64Locator = 0x07064b50;
    constexpr uint32_t kCentralDirectoryHeader = 0x02014b50;
    constexpr uint32_t kLocalFileHeader = 0x04034b50;
    constexpr uint16_t kZip64ExtraField = 0x0001;
    constexpr uint16_t kMethodStored = 0;
    constexpr uint16_t kMethodDeflate = 8;
    constexpr size_t kEndRecordSize = 22;
    constexpr size_t kMaxCommentSize = 0xFFFF;
    constexpr size_t kZip64EndRecordSize = 56;
    constexpr size_t kCentralHeaderSize = 46;
    constexpr size_t kLocalHeaderSize = 30;
    // Upper bound of what deflate can achieve on any input
    constexpr uint64_t kMaxDeflateRatio = 1032;

    // Whether [offset, offset + length) lies inside a buffer of `size` bytes, without overflow
    bool Fits(const size_t size, const uint64_t offset, const uint64_t length) {
        return offset <= size && length <= size - offset;
    }

    uint16_t ReadU16(std::span<const std::byte> data, size_t offset) {
        return static_cast<uint16_t>(std::to_integer<uint16_t>(data[offset]) |
                                     std::to_integer<uint16_t>(data[offset + 1]) << 8);
    }

    uint32_t ReadU32(std::span<const std::byte> data, size_t offset) {
        return static_cast<uint32_t>(ReadU16(data, offset)) | static_cast<uint32_t>(ReadU16(data, offset + 2)) << 16;
    }

    uint64_t ReadU64(std::span<const std::byte> data, size_t offset) {
        return static_cast<uint64_t>(ReadU32(data, offset)) | static_cast<uint64_t>(ReadU32(data, offset + 4)) << 32;
    }
}

Expected<ZipArchive> ZipArchive::Open(const std::span<const std::byte> data) {
    ZipArchive archive(data);
    if (auto read = archive.readCentralDirectory_(); !read) {
        return std::unexpected(read.error());
    }
    return archive;
}

const ZipEntry* ZipArchive::find(const std::string_view name) const {
    const auto it = std::ranges::find(entries_, name, &ZipEntry::name);
    return it == entries_.end() ? nullptr : &*it;
}

Expected<void> ZipArchive::readCentralDirectory_() {
    if (data_.size() < kEndRecordSize) {
        return Fail(ErrorKind::InvalidInput, "archive too small to be a zip file");
    }

    // The end record sits at the tail, possibly followed by a comment
    size_t endOffset = data_.size() - kEndRecordSize;
    const size_t searchLimit = data_.size() > kEndRecordSize + kMaxCommentSize
        ? data_.size() - kEndRecordSize - kMaxCommentSize : 0;
    while (ReadU32(data_, endOffset) != kEndOfCentralDirectory) {
        if (endOffset == searchLimit) {
            return Fail(ErrorKind::InvalidInput, "zip end of central directory not found");
        }
        --endOffset;
    }

    uint64_t entryCount = ReadU16(data_, endOffset + 10);
    uint64_t directoryOffset = ReadU32(data_, endOffset + 16);

    if (endOffset >= 20 && ReadU32(data_, endOffset - 20) == kZip64Locator) {
        const auto zip64EndOffset = ReadU64(data_, endOffset - 20 + 8);
        if (!Fits(data_.size(), zip64EndOffset, kZip64EndRecordSize) || ReadU32(data_, zip64EndOffset) != kZip64EndOfCentralDirectory) {
            return Fail(ErrorKind::InvalidInput, "corrupt zip64 end of central directory");
        }
        entryCount = ReadU64(data_, zip64EndOffset + 32);
        directoryOffset = ReadU64(data_, zip64EndOffset + 48);
    }

    if (!Fits(data_.size(), directoryOffset, 0)) {
        return Fail(ErrorKind::InvalidInput, "zip central directory lies outside the archive");
    }
    size_t offset = directoryOffset;
    for (uint64_t i = 0; i < entryCount; ++i) {
        if (!Fits(data_.size(), offset, kCentralHeaderSize) || ReadU32(data_, offset) != kCentralDirectoryHeader) {
            return Fail(ErrorKind::InvalidInput, std::format("corrupt zip central directory entry {}", i));
        }

        ZipEntry entry;
        entry.method = ReadU16(data_, offset + 10);
        entry.crc32 = ReadU32(data_, offset + 16);
        entry.compressedSize = ReadU32(data_, offset + 20);
        entry.uncompressedSize = ReadU32(data_, offset + 24);
        const auto nameLength = ReadU16(data_, offset + 28);
        const auto extraLength = ReadU16(data_, offset + 30);
        const auto commentLength = ReadU16(data_, offset + 32);
        entry.localHeaderOffset = ReadU32(data_, offset + 42);

        const size_t nameOffset = offset + kCentralHeaderSize;
        if (!Fits(data_.size(), nameOffset, static_cast<uint64_t>(nameLength) + extraLength)) {
            return Fail(ErrorKind::InvalidInput, "zip entry name runs past the end of the archive");
        }
        entry.name.assign(reinterpret_cast<const char*>(data_.data() + nameOffset), nameLength);

        // zip64 extra field carries only the values saturated in the fixed header, in order
        size_t extraOffset = nameOffset + nameLength;
        const size_t extraEnd = extraOffset + extraLength;
        while (extraOffset + 4 <= extraEnd) {
            const auto headerId = ReadU16(data_, extraOffset);
            const auto size = ReadU16(data_, extraOffset + 2);
            size_t field = extraOffset + 4;
            if (headerId == kZip64ExtraField) {
                const size_t fieldEnd = std::min(field + size, extraEnd);
                if (entry.uncompressedSize == 0xFFFFFFFFu && field + 8 <= fieldEnd) {
                    entry.uncompressedSize = ReadU64(data_, field);
                    field += 8;
                }
                if (entry.compressedSize == 0xFFFFFFFFu && field + 8 <= fieldEnd) {
                    entry.compressedSize = ReadU64(data_, field);
                    field += 8;
                }
                if (entry.localHeaderOffset == 0xFFFFFFFFu && field + 8 <= fieldEnd) {
                    entry.localHeaderOffset = ReadU64(data_, field);
                }
            }
            extraOffset += 4 + size;
        }

        entries_.push_back(std::move(entry));
        offset = extraEnd + commentLength;
    }
    return {};
}

Expected<std::vector<std::byte>> ZipArchive::extract(const ZipEntry& entry) const {
    const auto local = entry.localHeaderOffset;
    if (!Fits(data_.size(), local, kLocalHeaderSize) || ReadU32(data_, local) != kLocalFileHeader) {
        return Fail(ErrorKind::InvalidInput, std::format("corrupt local header for {}", entry.name));
    }
    const size_t dataOffset = local + kLocalHeaderSize + ReadU16(data_, local + 26) + ReadU16(data_, local + 28);
    if (!Fits(data_.size(), dataOffset, entry.compressedSize)) {
        return Fail(ErrorKind::InvalidInput, std::format("{} runs past the end of the archive", entry.name));
    }
    // Sizes are validated before anything is allocated; zlib takes 32-bit lengths
    if (entry.uncompressedSize > std::numeric_limits<uInt>::max() ||
        entry.compressedSize > std::numeric_limits<uInt>::max() ||
        entry.uncompressedSize > entry.compressedSize * kMaxDeflateRatio) {
        return Fail(ErrorKind::InvalidInput,
                    std::format("{} declares an implausible size of {} bytes", entry.name, entry.uncompressedSize));
    }
    const auto compressed = data_.subspan(dataOffset, entry.compressedSize);

    std::vector<std::byte> output(entry.uncompressedSize);
    if (entry.method == kMethodStored) {
        if (entry.compressedSize != entry.uncompressedSize) {
            return Fail(ErrorKind::InvalidInput, std::format("stored entry {} has inconsistent sizes", entry.name));
        }
        std::ranges::copy(compressed, output.begin());
    }
    else if (entry.method == kMethodDeflate) {
        z_stream stream{};
        if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
            return Fail(ErrorKind::StorageFailure, "zlib initialization failed");
        }
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(compressed.data()));
        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_out = reinterpret_cast<Bytef*>(output.data());
        stream.avail_out = static_cast<uInt>(output.size());
        const auto status = inflate(&stream, Z_FINISH);
        const auto produced = stream.total_out;
        inflateEnd(&stream);
        if (status != Z_STREAM_END || produced != output.size()) {
            return Fail(ErrorKind::InvalidInput, std::format("cannot inflate {} (zlib status {})", entry.name, status));
        }
    }
    else {
        return Fail(ErrorKind::InvalidInput,
                    std::format("{} uses unsupported compression method {}", entry.name, entry.method));
    }

    const auto checksum = crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(output.data()),
                                static_cast<uInt>(output.size()));
    if (checksum != entry.crc32) {
        return Fail(ErrorKind::InvalidInput, std::format("CRC mismatch in {}", entry.name));
    }
    return output;
}

} // namespace motionlib
