#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../../shared/AssetId.hpp"
#include "../../shared/Error.hpp"
#include "../../shared/entities.hpp"
#include "AssetLocator.hpp"
#include "ThumbnailCache.hpp"

namespace motionlib {

struct SaveOptions {
    // Sub-directory the asset lands in: the trajectory category tag or the model bundle name
    std::optional<std::string> group;
};

// Validated storage for one asset category. Identifiers are recomputed from relative paths
// on every lookup, so the filesystem is the only source of truth.
class AssetStore {
public:
    AssetStore(AssetCategory category, std::filesystem::path root, ThumbnailCache& thumbnails,
               AssetIdFunction identify = &AssetId);

    [[nodiscard]] auto category() const -> AssetCategory { return locator_.category(); }
    [[nodiscard]] auto root() const -> const std::filesystem::path& { return locator_.root(); }
    [[nodiscard]] auto locator() const -> const AssetLocator& { return locator_; }

    [[nodiscard]] auto list(const std::optional<std::string>& categoryFilter = std::nullopt) const
        -> std::vector<AssetSummary>;
    [[nodiscard]] auto resolve(std::string_view id) const -> std::optional<std::filesystem::path>;
    [[nodiscard]] auto summary(std::string_view id) const -> std::optional<AssetSummary>;
    [[nodiscard]] auto summarize(const std::filesystem::path& file) const -> std::optional<AssetSummary>;

    auto save(std::string_view filename, std::span<const std::byte> content, const SaveOptions& options = {})
        -> Expected<AssetSummary>;
    auto remove(std::string_view id) -> Expected<bool>;

    // Model bundles only; the trajectory store reports every id as unknown
    [[nodiscard]] auto listDirectoryFiles(std::string_view modelId) const -> std::optional<std::vector<std::string>>;
    [[nodiscard]] auto resolveDirectoryFile(std::string_view modelId, std::string_view subPath) const
        -> Expected<std::filesystem::path>;

    // Relative directory a thumbnail for this asset is mirrored into
    [[nodiscard]] auto thumbnailDirectory(const AssetSummary& asset) const -> std::filesystem::path;

private:
    [[nodiscard]] auto bundleDirectory_(const std::filesystem::path& entryDocument) const
        -> std::optional<std::filesystem::path>;
    [[nodiscard]] auto groupOf_(const std::filesystem::path& file) const -> std::optional<std::string>;
    auto removeModel_(const std::filesystem::path& entryDocument) -> Expected<void>;

private:
    AssetLocator locator_;
    ThumbnailCache& thumbnails_;
    AssetIdFunction identify_;
};

} // namespace motionlib
