#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rfl/Timestamp.hpp"

namespace motionlib {

using FileTimestamp = rfl::Timestamp<"%FT%TZ">;

enum class AssetCategory {
    Trajectories,
    Models,
};

constexpr auto CategoryName(const AssetCategory category) -> std::string_view {
    return category == AssetCategory::Trajectories ? "trajectories" : "models";
}

constexpr auto ParseCategory(const std::string_view name) -> std::optional<AssetCategory> {
    if (name == "trajectories") return AssetCategory::Trajectories;
    if (name == "models") return AssetCategory::Models;
    return std::nullopt;
}

struct AssetSummary {
    std::string id;
    std::string name;
    std::string relativePath;
    // Trajectories: relative parent directory. Models: the bundle directory (display name).
    std::optional<std::string> category;
    uint64_t sizeBytes = 0;
    FileTimestamp lastModified;
};

struct IndexedAsset {
    AssetSummary asset;
    std::optional<std::string> thumbnail;  // relative to the thumbnails root
};

struct LibraryIndex {
    uint32_t version = 1;
    FileTimestamp buildTime;
    std::string dataDirectory;
    std::vector<IndexedAsset> trajectories;
    std::vector<IndexedAsset> models;
};

} // namespace motionlib
