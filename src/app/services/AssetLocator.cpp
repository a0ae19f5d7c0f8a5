#include "AssetLocator.hpp"

#include <algorithm>

namespace motionlib {

auto RecognizedExtensions(const AssetCategory category) -> const std::unordered_set<std::string>& {
    return category == AssetCategory::Trajectories ? kTrajectoryFileExtensions : kModelFileExtensions;
}

auto HasRecognizedExtension(const AssetCategory category, const std::filesystem::path& path) -> bool {
    return RecognizedExtensions(category).contains(path.extension().string());
}

AssetLocator::AssetLocator(const AssetCategory category, std::filesystem::path root)
    : category_(category), root_(std::move(root)) {}

auto AssetLocator::ListAssetFiles() const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    const auto& extensions = RecognizedExtensions(category_);

    if (category_ == AssetCategory::Trajectories) {
        CollectFiles_(root_, true, extensions, files);
    }
    else {
        CollectFiles_(root_, false, extensions, files);

        std::error_code ec;
        for (auto it = std::filesystem::directory_iterator(root_, kDirectoryOptions, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec)) {
                CollectFiles_(it->path(), false, extensions, files);
            }
        }
    }

    std::ranges::sort(files);
    return files;
}

auto AssetLocator::ListFolder(const std::filesystem::path& folder) const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    CollectFiles_(folder, false, RecognizedExtensions(category_), files);
    std::ranges::sort(files);
    return files;
}

auto AssetLocator::CollectFiles_(const std::filesystem::path& root, const bool recursive,
                                 const std::unordered_set<std::string>& extensions,
                                 std::vector<std::filesystem::path>& out) -> void {
    if (root.empty())
        return;
    std::error_code ec;

    if (!std::filesystem::is_directory(root, ec))
        return;

    if (recursive) {
        FindAssets(std::filesystem::recursive_directory_iterator(root, kDirectoryOptions, ec),
                   std::filesystem::recursive_directory_iterator(), extensions, out);
    }
    else {
        FindAssets(std::filesystem::directory_iterator(root, kDirectoryOptions, ec),
                   std::filesystem::directory_iterator(), extensions, out);
    }
}

} // namespace motionlib
