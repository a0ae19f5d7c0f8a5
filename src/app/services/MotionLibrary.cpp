#include "MotionLibrary.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "../../shared/AssetId.hpp"
#include "../Utils.hpp"

namespace motionlib {

MotionLibrary::MotionLibrary(LibraryConfiguration config)
    : config_(std::move(config)),
      thumbnails_(config_.thumbnailsRoot),
      trajectories_(AssetCategory::Trajectories, config_.trajectoriesRoot, thumbnails_),
      models_(AssetCategory::Models, config_.modelsRoot, thumbnails_) {}

auto MotionLibrary::ensureLayout() const -> Expected<void> {
    const std::filesystem::path roots[] = {
        config_.trajectoriesRoot,
        config_.modelsRoot,
        thumbnails_.CategoryRoot(AssetCategory::Trajectories),
        thumbnails_.CategoryRoot(AssetCategory::Models),
    };

    for (const auto& root : roots) {
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        if (ec) {
            return Fail(ErrorKind::StorageFailure, std::format("cannot create {}: {}", root.string(), ec.message()));
        }
    }
    return {};
}

auto MotionLibrary::store(const AssetCategory category) -> AssetStore& {
    return category == AssetCategory::Trajectories ? trajectories_ : models_;
}

auto MotionLibrary::store(const AssetCategory category) const -> const AssetStore& {
    return category == AssetCategory::Trajectories ? trajectories_ : models_;
}

auto MotionLibrary::buildIndex() const -> LibraryIndex {
    LibraryIndex index{
        .version = 1,
        .buildTime = CurrentTimestamp(),
        .dataDirectory = config_.dataRoot.generic_string(),
        .trajectories = indexCategory_(AssetCategory::Trajectories),
        .models = indexCategory_(AssetCategory::Models)
    };
    spdlog::debug("Indexed {} trajectories and {} models", index.trajectories.size(), index.models.size());
    return index;
}

auto MotionLibrary::indexCategory_(const AssetCategory category) const -> std::vector<IndexedAsset> {
    std::vector<IndexedAsset> indexed;
    for (auto& asset : store(category).list()) {
        std::optional<std::string> thumbnail;
        if (const auto cached = thumbnails_.Get(category, asset.id)) {
            thumbnail = CanonicalRelativePath(thumbnails_.root(), *cached);
        }
        indexed.push_back(IndexedAsset{.asset = std::move(asset), .thumbnail = std::move(thumbnail)});
    }
    return indexed;
}

} // namespace motionlib
