#pragma once
#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../../shared/Error.hpp"
#include "../../shared/entities.hpp"

namespace motionlib {

enum class ThumbnailFormat {
    Webp,
    Gif,
    Png,
    Jpeg,
};

// Lookup order used by Get when several artifacts would match
constexpr auto kThumbnailFormats = std::array{
    ThumbnailFormat::Webp, ThumbnailFormat::Gif, ThumbnailFormat::Png, ThumbnailFormat::Jpeg
};

[[nodiscard]] auto ThumbnailExtension(ThumbnailFormat format) -> std::string_view;
[[nodiscard]] auto ThumbnailMediaType(ThumbnailFormat format) -> std::string_view;
[[nodiscard]] auto ThumbnailFormatFromPath(const std::filesystem::path& path) -> std::optional<ThumbnailFormat>;

// Derived preview artifacts stored as <root>/<category>/<asset dir>/<id>.<ext>.
// Pure cache: no freshness check against the source asset.
class ThumbnailCache {
public:
    explicit ThumbnailCache(std::filesystem::path root);

    [[nodiscard]] auto Get(AssetCategory category, std::string_view id) const -> std::optional<std::filesystem::path>;

    auto Put(AssetCategory category,
             std::string_view id,
             const std::filesystem::path& relativeDirectory,
             std::span<const std::byte> bytes,
             ThumbnailFormat format) -> Expected<std::filesystem::path>;

    auto Remove(AssetCategory category, std::string_view id) -> size_t;

    [[nodiscard]] auto PathFor(AssetCategory category,
                               std::string_view id,
                               const std::filesystem::path& relativeDirectory,
                               ThumbnailFormat format) const -> std::filesystem::path;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }
    [[nodiscard]] auto CategoryRoot(AssetCategory category) const -> std::filesystem::path;

private:
    std::filesystem::path root_;
};

} // namespace motionlib
