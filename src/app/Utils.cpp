#include "Utils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <fstream>
#include <iterator>
#include <string_view>
#include <unistd.h>

#include <utf8cpp/utf8.h>

#include "spdlog/spdlog.h"

namespace motionlib {

namespace {
    bool SanitizeField(std::string& value, std::string_view fieldName, std::string_view assetId) {
        if (utf8::is_valid(value.begin(), value.end())) {
            return false;
        }

        spdlog::warn("Invalid UTF-8 in {} of asset {}: '{}'. Sanitizing before serialization",
                     fieldName, assetId, value);
        value = SanitizeString(value);
        return true;
    }

    size_t SanitizeAssets(std::vector<IndexedAsset>& assets) {
        size_t sanitizedFields = 0;
        for (auto& [asset, thumbnail] : assets) {
            sanitizedFields += static_cast<size_t>(SanitizeField(asset.name, "name", asset.id));
            sanitizedFields += static_cast<size_t>(SanitizeField(asset.relativePath, "relativePath", asset.id));
            if (asset.category) {
                sanitizedFields += static_cast<size_t>(SanitizeField(*asset.category, "category", asset.id));
            }
            if (thumbnail) {
                sanitizedFields += static_cast<size_t>(SanitizeField(*thumbnail, "thumbnail", asset.id));
            }
        }
        return sanitizedFields;
    }

    FileTimestamp FromTimeT(const std::time_t seconds) {
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        return FileTimestamp(utc);
    }
}

size_t SanitizeStrings(LibraryIndex& index) {
    size_t sanitizedFields = SanitizeAssets(index.trajectories) + SanitizeAssets(index.models);
    if (!utf8::is_valid(index.dataDirectory.begin(), index.dataDirectory.end())) {
        index.dataDirectory = SanitizeString(index.dataDirectory);
        ++sanitizedFields;
    }

    if (sanitizedFields > 0) {
        spdlog::warn("Sanitized {} invalid UTF-8 fields before writing output", sanitizedFields);
    }

    return sanitizedFields;
}

std::string SanitizeString(const std::string_view text) {
    if (utf8::is_valid(text.begin(), text.end())) {
        return std::string(text);
    }

    std::string sanitized;
    sanitized.reserve(text.size());
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(sanitized));
    return sanitized;
}

bool IsSafeRelativePath(const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        return false;
    }
    for (const auto& segment : path) {
        if (segment == "..") {
            return false;
        }
    }
    return true;
}

std::string_view ContentTypeFor(const std::filesystem::path& path) {
    auto suffix = path.extension().string();
    std::ranges::transform(suffix.begin(), suffix.end(), suffix.begin(), ::tolower);

    if (suffix == ".xml") return "application/xml";
    if (suffix == ".stl") return "model/stl";
    if (suffix == ".obj" || suffix == ".dae" || suffix == ".mesh") return "model/mesh";
    if (suffix == ".png") return "image/png";
    if (suffix == ".jpg" || suffix == ".jpeg") return "image/jpeg";
    if (suffix == ".gif") return "image/gif";
    if (suffix == ".webp") return "image/webp";
    if (suffix == ".svg") return "image/svg+xml";
    return "application/octet-stream";
}

Expected<void> WriteFileAtomically(const std::filesystem::path& destination, const std::span<const std::byte> bytes) {
    static std::atomic<uint32_t> sequence{0};

    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
        return Fail(ErrorKind::StorageFailure,
                    std::format("cannot create {}: {}", destination.parent_path().string(), ec.message()));
    }

    const auto temporary = destination.parent_path() /
        std::format(".{}.{}-{}.tmp", destination.filename().string(), ::getpid(), sequence++);

    {
        std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Fail(ErrorKind::StorageFailure, std::format("cannot open {} for writing", temporary.string()));
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temporary, ec);
            return Fail(ErrorKind::StorageFailure, std::format("short write to {}", temporary.string()));
        }
    }

    std::filesystem::rename(temporary, destination, ec);
    if (ec) {
        const auto message = std::format("cannot move {} into place: {}", destination.string(), ec.message());
        std::filesystem::remove(temporary, ec);
        return Fail(ErrorKind::StorageFailure, message);
    }
    return {};
}

Expected<std::vector<std::byte>> ReadFileBytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Fail(ErrorKind::NotFound, std::format("cannot open {}", path.string()));
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Fail(ErrorKind::StorageFailure, std::format("cannot stat {}: {}", path.string(), ec.message()));
    }

    std::vector<std::byte> bytes(size);
    file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (file.gcount() != static_cast<std::streamsize>(size)) {
        return Fail(ErrorKind::StorageFailure, std::format("short read from {}", path.string()));
    }
    return bytes;
}

FileTimestamp ToTimestamp(const std::filesystem::file_time_type time) {
    const auto systemTime = std::chrono::clock_cast<std::chrono::system_clock>(time);
    return FromTimeT(std::chrono::system_clock::to_time_t(systemTime));
}

FileTimestamp CurrentTimestamp() {
    return FromTimeT(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

} // namespace motionlib
