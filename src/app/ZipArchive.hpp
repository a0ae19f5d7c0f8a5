#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/Error.hpp"

namespace motionlib {

struct ZipEntry {
    std::string name;
    uint16_t method = 0;  // 0 stored, 8 deflate
    uint32_t crc32 = 0;
    uint64_t compressedSize = 0;
    uint64_t uncompressedSize = 0;
    uint64_t localHeaderOffset = 0;
};

// Read-only view over an in-memory zip archive (the container format of .npz files).
// Supports stored and deflated members and zip64 size/offset records.
class ZipArchive {
public:
    static Expected<ZipArchive> Open(std::span<const std::byte> data);

    [[nodiscard]] const std::vector<ZipEntry>& entries() const { return entries_; }
    [[nodiscard]] const ZipEntry* find(std::string_view name) const;
    [[nodiscard]] Expected<std::vector<std::byte>> extract(const ZipEntry& entry) const;

private:
    explicit ZipArchive(std::span<const std::byte> data) : data_(data) {}

    Expected<void> readCentralDirectory_();

    std::span<const std::byte> data_;
    std::vector<ZipEntry> entries_;
};

} // namespace motionlib
