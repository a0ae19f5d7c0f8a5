#include "ThumbnailCache.hpp"

#include <algorithm>
#include <format>
#include <vector>

#include <spdlog/spdlog.h>

#include "../Utils.hpp"
#include "AssetLocator.hpp"

namespace motionlib {

auto ThumbnailExtension(const ThumbnailFormat format) -> std::string_view {
    switch (format) {
        case ThumbnailFormat::Webp: return ".webp";
        case ThumbnailFormat::Gif: return ".gif";
        case ThumbnailFormat::Png: return ".png";
        case ThumbnailFormat::Jpeg: return ".jpg";
    }
    return ".bin";
}

auto ThumbnailMediaType(const ThumbnailFormat format) -> std::string_view {
    switch (format) {
        case ThumbnailFormat::Webp: return "image/webp";
        case ThumbnailFormat::Gif: return "image/gif";
        case ThumbnailFormat::Png: return "image/png";
        case ThumbnailFormat::Jpeg: return "image/jpeg";
    }
    return "application/octet-stream";
}

auto ThumbnailFormatFromPath(const std::filesystem::path& path) -> std::optional<ThumbnailFormat> {
    const auto extension = path.extension().string();
    for (const auto format : kThumbnailFormats) {
        if (extension == ThumbnailExtension(format)) {
            return format;
        }
    }
    return std::nullopt;
}

ThumbnailCache::ThumbnailCache(std::filesystem::path root) : root_(std::move(root)) {}

auto ThumbnailCache::CategoryRoot(const AssetCategory category) const -> std::filesystem::path {
    return root_ / CategoryName(category);
}

auto ThumbnailCache::PathFor(const AssetCategory category,
                             const std::string_view id,
                             const std::filesystem::path& relativeDirectory,
                             const ThumbnailFormat format) const -> std::filesystem::path {
    return CategoryRoot(category) / relativeDirectory / std::format("{}{}", id, ThumbnailExtension(format));
}

auto ThumbnailCache::Get(const AssetCategory category, const std::string_view id) const
    -> std::optional<std::filesystem::path> {
    const auto categoryRoot = CategoryRoot(category);
    std::error_code ec;
    if (id.empty() || !std::filesystem::is_directory(categoryRoot, ec)) {
        return std::nullopt;
    }

    std::optional<std::filesystem::path> found;
    size_t bestRank = kThumbnailFormats.size();
    for (auto it = std::filesystem::recursive_directory_iterator(categoryRoot, kDirectoryOptions, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->path().stem() != id) {
            continue;
        }
        const auto format = ThumbnailFormatFromPath(it->path());
        if (!format) {
            continue;
        }
        const auto rank = static_cast<size_t>(std::ranges::find(kThumbnailFormats, *format) - kThumbnailFormats.begin());
        if (rank < bestRank) {
            bestRank = rank;
            found = it->path();
        }
    }
    return found;
}

auto ThumbnailCache::Put(const AssetCategory category,
                         const std::string_view id,
                         const std::filesystem::path& relativeDirectory,
                         const std::span<const std::byte> bytes,
                         const ThumbnailFormat format) -> Expected<std::filesystem::path> {
    if (id.empty()) {
        return Fail(ErrorKind::InvalidInput, "thumbnail id must not be empty");
    }
    if (!relativeDirectory.empty() && !IsSafeRelativePath(relativeDirectory)) {
        return Fail(ErrorKind::InvalidInput,
                    std::format("thumbnail directory '{}' escapes the cache root", relativeDirectory.string()));
    }

    // A regenerated artifact replaces whatever was cached for the id, in any format or directory
    const auto removed = Remove(category, id);
    if (removed > 0) {
        spdlog::debug("Replaced {} cached thumbnail(s) for {}", removed, id);
    }

    const auto destination = PathFor(category, id, relativeDirectory, format);
    if (auto written = WriteFileAtomically(destination, bytes); !written) {
        return std::unexpected(written.error());
    }
    return destination;
}

auto ThumbnailCache::Remove(const AssetCategory category, const std::string_view id) -> size_t {
    const auto categoryRoot = CategoryRoot(category);
    std::error_code ec;
    if (id.empty() || !std::filesystem::is_directory(categoryRoot, ec)) {
        return 0;
    }

    std::vector<std::filesystem::path> matches;
    for (auto it = std::filesystem::recursive_directory_iterator(categoryRoot, kDirectoryOptions, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().stem() == id && ThumbnailFormatFromPath(it->path())) {
            matches.push_back(it->path());
        }
    }

    size_t removed = 0;
    for (const auto& path : matches) {
        if (std::filesystem::remove(path, ec)) {
            ++removed;
        }
        else if (ec) {
            spdlog::warn("Failed to remove cached thumbnail {}: {}", path.string(), ec.message());
        }
    }
    return removed;
}

} // namespace motionlib
