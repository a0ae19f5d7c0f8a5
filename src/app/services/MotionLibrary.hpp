#pragma once
#include "../../shared/Error.hpp"
#include "../../shared/entities.hpp"
#include "../../shared/index.hpp"
#include "AssetStore.hpp"
#include "ThumbnailCache.hpp"

namespace motionlib {

// Owns the thumbnail cache and both category stores. Built once per process from its
// configuration and passed by reference to the CLI commands and the render pipeline.
class MotionLibrary {
public:
    explicit MotionLibrary(LibraryConfiguration config);

    MotionLibrary(const MotionLibrary&) = delete;
    MotionLibrary& operator=(const MotionLibrary&) = delete;

    // Creates the category and thumbnail roots that do not exist yet
    auto ensureLayout() const -> Expected<void>;

    [[nodiscard]] auto trajectories() -> AssetStore& { return trajectories_; }
    [[nodiscard]] auto trajectories() const -> const AssetStore& { return trajectories_; }
    [[nodiscard]] auto models() -> AssetStore& { return models_; }
    [[nodiscard]] auto models() const -> const AssetStore& { return models_; }
    [[nodiscard]] auto store(AssetCategory category) -> AssetStore&;
    [[nodiscard]] auto store(AssetCategory category) const -> const AssetStore&;
    [[nodiscard]] auto thumbnails() -> ThumbnailCache& { return thumbnails_; }
    [[nodiscard]] auto thumbnails() const -> const ThumbnailCache& { return thumbnails_; }
    [[nodiscard]] auto configuration() const -> const LibraryConfiguration& { return config_; }

    [[nodiscard]] auto buildIndex() const -> LibraryIndex;

private:
    [[nodiscard]] auto indexCategory_(AssetCategory category) const -> std::vector<IndexedAsset>;

private:
    LibraryConfiguration config_;
    ThumbnailCache thumbnails_;
    AssetStore trajectories_;
    AssetStore models_;
};

} // namespace motionlib
