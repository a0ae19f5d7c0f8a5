#include "AssetStore.hpp"

#include <algorithm>
#include <format>
#include <iterator>

#include <spdlog/spdlog.h>

#include "../../shared/AssetId.hpp"
#include "../Utils.hpp"

namespace motionlib {

AssetStore::AssetStore(const AssetCategory category, std::filesystem::path root, ThumbnailCache& thumbnails,
                       const AssetIdFunction identify)
    : locator_(category, std::move(root)), thumbnails_(thumbnails), identify_(identify) {}

auto AssetStore::list(const std::optional<std::string>& categoryFilter) const -> std::vector<AssetSummary> {
    std::vector<AssetSummary> assets;
    for (const auto& file : locator_.ListAssetFiles()) {
        auto asset = summarize(file);
        if (!asset) {
            continue;
        }
        if (categoryFilter && asset->category != categoryFilter) {
            continue;
        }
        assets.push_back(std::move(*asset));
    }
    return assets;
}

auto AssetStore::resolve(const std::string_view id) const -> std::optional<std::filesystem::path> {
    if (id.size() != kAssetIdLength) {
        return std::nullopt;
    }
    for (const auto& file : locator_.ListAssetFiles()) {
        if (identify_(CanonicalRelativePath(root(), file)) == id) {
            return file;
        }
    }
    return std::nullopt;
}

auto AssetStore::summary(const std::string_view id) const -> std::optional<AssetSummary> {
    const auto file = resolve(id);
    if (!file) {
        return std::nullopt;
    }
    return summarize(*file);
}

auto AssetStore::summarize(const std::filesystem::path& file) const -> std::optional<AssetSummary> {
    auto relativePath = CanonicalRelativePath(root(), file);
    if (relativePath.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        spdlog::debug("Skipping {}: {}", file.string(), ec.message());
        return std::nullopt;
    }
    const auto modified = std::filesystem::last_write_time(file, ec);

    return AssetSummary{
        .id = identify_(relativePath),
        .name = file.filename().string(),
        .relativePath = std::move(relativePath),
        .category = groupOf_(file),
        .sizeBytes = size,
        .lastModified = ec ? CurrentTimestamp() : ToTimestamp(modified)
    };
}

auto AssetStore::save(const std::string_view filename, const std::span<const std::byte> content,
                      const SaveOptions& options) -> Expected<AssetSummary> {
    const std::filesystem::path name(filename);
    if (filename.empty() || name.has_parent_path() || filename.contains('/') || name == "." || name == "..") {
        return Fail(ErrorKind::InvalidInput, std::format("'{}' is not a plain file name", filename));
    }
    if (!HasRecognizedExtension(category(), name)) {
        return Fail(ErrorKind::InvalidInput,
                    category() == AssetCategory::Trajectories ? "Only .npy and .npz files are supported"
                                                              : "Only .xml files are supported");
    }

    std::filesystem::path directory = root();
    if (options.group && !options.group->empty()) {
        const std::filesystem::path group(*options.group);
        if (!IsSafeRelativePath(group)) {
            return Fail(ErrorKind::InvalidInput, std::format("group '{}' escapes the {} root",
                                                             *options.group, CategoryName(category())));
        }
        if (category() == AssetCategory::Models && std::distance(group.begin(), group.end()) != 1) {
            return Fail(ErrorKind::InvalidInput,
                        std::format("model name '{}' must be a single directory name", *options.group));
        }
        directory /= group;
    }
    else if (category() == AssetCategory::Models) {
        directory /= name.stem();
    }

    const auto destination = (directory / name).lexically_normal();
    const auto id = identify_(CanonicalRelativePath(root(), destination));

    if (const auto existing = resolve(id); existing && existing->lexically_normal() != destination) {
        spdlog::error("Identifier {} of {} already belongs to {}", id, destination.string(), existing->string());
        return Fail(ErrorKind::IdentifierCollision,
                    std::format("identifier {} already belongs to {}", id,
                                CanonicalRelativePath(root(), *existing)));
    }

    std::error_code ec;
    const bool replacing = std::filesystem::exists(destination, ec);

    if (auto written = WriteFileAtomically(destination, content); !written) {
        spdlog::error("Failed to save {}: {}", destination.string(), written.error().message);
        return std::unexpected(written.error());
    }

    if (replacing && thumbnails_.Remove(category(), id) > 0) {
        spdlog::info("Invalidated stale thumbnail for {}", id);
    }

    auto saved = summarize(destination);
    if (!saved) {
        return Fail(ErrorKind::StorageFailure, std::format("{} vanished after writing", destination.string()));
    }
    spdlog::info("Saved {} {} ({} bytes, id {})", CategoryName(category()), saved->relativePath,
                 saved->sizeBytes, saved->id);
    return std::move(*saved);
}

auto AssetStore::remove(const std::string_view id) -> Expected<bool> {
    const auto file = resolve(id);
    if (!file) {
        return false;
    }

    if (category() == AssetCategory::Models) {
        if (auto removed = removeModel_(*file); !removed) {
            return std::unexpected(removed.error());
        }
    }
    else {
        std::error_code ec;
        std::filesystem::remove(*file, ec);
        if (ec) {
            return Fail(ErrorKind::StorageFailure, std::format("cannot delete {}: {}", file->string(), ec.message()));
        }
    }

    const auto thumbnailsRemoved = thumbnails_.Remove(category(), id);
    spdlog::info("Deleted {} {} (id {}, {} thumbnail(s) invalidated)", CategoryName(category()),
                 CanonicalRelativePath(root(), *file), id, thumbnailsRemoved);
    return true;
}

auto AssetStore::removeModel_(const std::filesystem::path& entryDocument) -> Expected<void> {
    std::error_code ec;
    const auto bundle = bundleDirectory_(entryDocument);

    std::vector<std::filesystem::path> entries;
    if (bundle) {
        FindAssets(std::filesystem::directory_iterator(*bundle, kDirectoryOptions, ec),
                   std::filesystem::directory_iterator(), kModelFileExtensions, entries);
    }

    // The bundle directory goes with its last entry document; siblings keep the shared files
    if (bundle && entries.size() <= 1) {
        std::filesystem::remove_all(*bundle, ec);
        if (ec) {
            return Fail(ErrorKind::StorageFailure, std::format("cannot delete {}: {}", bundle->string(), ec.message()));
        }
        return {};
    }

    std::filesystem::remove(entryDocument, ec);
    if (ec) {
        return Fail(ErrorKind::StorageFailure,
                    std::format("cannot delete {}: {}", entryDocument.string(), ec.message()));
    }
    return {};
}

auto AssetStore::listDirectoryFiles(const std::string_view modelId) const -> std::optional<std::vector<std::string>> {
    if (category() != AssetCategory::Models) {
        return std::nullopt;
    }
    const auto entryDocument = resolve(modelId);
    if (!entryDocument) {
        return std::nullopt;
    }

    const auto bundle = bundleDirectory_(*entryDocument);
    if (!bundle) {
        return std::vector<std::string>{entryDocument->filename().string()};
    }

    std::vector<std::string> files;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(*bundle, kDirectoryOptions, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(CanonicalRelativePath(*bundle, it->path()));
        }
    }
    std::ranges::sort(files);
    return files;
}

auto AssetStore::resolveDirectoryFile(const std::string_view modelId, const std::string_view subPath) const
    -> Expected<std::filesystem::path> {
    const std::filesystem::path requested(subPath);
    if (!IsSafeRelativePath(requested)) {
        spdlog::warn("Rejected bundle path '{}' for model {}", subPath, modelId);
        return Fail(ErrorKind::InvalidInput, std::format("'{}' is not a path inside the model directory", subPath));
    }
    if (category() != AssetCategory::Models) {
        return Fail(ErrorKind::NotFound, "trajectories have no bundle directory");
    }

    const auto entryDocument = resolve(modelId);
    if (!entryDocument) {
        return Fail(ErrorKind::NotFound, std::format("model {} not found", modelId));
    }

    const auto bundle = bundleDirectory_(*entryDocument);
    if (!bundle) {
        if (requested.lexically_normal() == entryDocument->filename()) {
            return *entryDocument;
        }
        return Fail(ErrorKind::NotFound, std::format("'{}' not found in model {}", subPath, modelId));
    }

    std::error_code ec;
    const auto canonicalBundle = std::filesystem::canonical(*bundle, ec);
    if (ec) {
        return Fail(ErrorKind::NotFound, std::format("model directory of {} is gone", modelId));
    }
    const auto candidate = std::filesystem::canonical(*bundle / requested, ec);
    if (ec) {
        return Fail(ErrorKind::NotFound, std::format("'{}' not found in model {}", subPath, modelId));
    }

    // Symbolic links may point anywhere; only the resolved location counts
    if (CanonicalRelativePath(canonicalBundle, candidate).empty()) {
        spdlog::warn("Rejected bundle path '{}' for model {}: resolves outside the bundle", subPath, modelId);
        return Fail(ErrorKind::InvalidInput, std::format("'{}' resolves outside the model directory", subPath));
    }
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        return Fail(ErrorKind::NotFound, std::format("'{}' is not a file in model {}", subPath, modelId));
    }
    return candidate;
}

auto AssetStore::thumbnailDirectory(const AssetSummary& asset) const -> std::filesystem::path {
    return std::filesystem::path(asset.relativePath).parent_path();
}

auto AssetStore::bundleDirectory_(const std::filesystem::path& entryDocument) const
    -> std::optional<std::filesystem::path> {
    if (category() != AssetCategory::Models) {
        return std::nullopt;
    }
    const auto relative = std::filesystem::path(CanonicalRelativePath(root(), entryDocument));
    if (!relative.has_parent_path()) {
        return std::nullopt;
    }
    return entryDocument.parent_path();
}

auto AssetStore::groupOf_(const std::filesystem::path& file) const -> std::optional<std::string> {
    const auto relative = std::filesystem::path(CanonicalRelativePath(root(), file));
    if (!relative.has_parent_path()) {
        return std::nullopt;
    }
    if (category() == AssetCategory::Models) {
        return relative.begin()->string();
    }
    return relative.parent_path().generic_string();
}

} // namespace motionlib
