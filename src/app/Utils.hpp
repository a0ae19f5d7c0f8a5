#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/Error.hpp"
#include "../shared/entities.hpp"

namespace motionlib {

size_t SanitizeStrings(LibraryIndex& index);
std::string SanitizeString(std::string_view text);

// True for a non-empty relative path without root, drive or ".." segments
bool IsSafeRelativePath(const std::filesystem::path& path);

// Media type served for a model bundle file, chosen by extension
std::string_view ContentTypeFor(const std::filesystem::path& path);

// Writes through a temporary sibling file and renames it over `destination`
Expected<void> WriteFileAtomically(const std::filesystem::path& destination, std::span<const std::byte> bytes);

Expected<std::vector<std::byte>> ReadFileBytes(const std::filesystem::path& path);

FileTimestamp ToTimestamp(std::filesystem::file_time_type time);
FileTimestamp CurrentTimestamp();

} // namespace motionlib
