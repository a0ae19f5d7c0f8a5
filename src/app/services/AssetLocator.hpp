#pragma once
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "../../shared/entities.hpp"

constexpr auto kDirectoryOptions = std::filesystem::directory_options::skip_permission_denied;
const auto kTrajectoryFileExtensions = std::unordered_set<std::string>{".npy", ".npz"};
const auto kModelFileExtensions = std::unordered_set<std::string>{".xml"};

namespace motionlib {

[[nodiscard]] auto RecognizedExtensions(AssetCategory category) -> const std::unordered_set<std::string>&;
[[nodiscard]] auto HasRecognizedExtension(AssetCategory category, const std::filesystem::path& path) -> bool;

template<typename Iter>
auto FindAssets(Iter begin, Iter end, const std::unordered_set<std::string>& extensions,
                std::vector<std::filesystem::path>& out) -> void {
    std::error_code ec;
    for (auto it = begin; it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        if (extensions.contains(it->path().extension().string())) {
            out.push_back(it->path());
        }
    }
}

// Enumerates asset files of one category below its root. Models are the entry documents
// found directly in the root or in a first-level bundle directory; deeper documents belong
// to their bundle and are never reported.
class AssetLocator {
public:
    AssetLocator(AssetCategory category, std::filesystem::path root);

    [[nodiscard]] auto ListAssetFiles() const -> std::vector<std::filesystem::path>;
    [[nodiscard]] auto ListFolder(const std::filesystem::path& folder) const -> std::vector<std::filesystem::path>;
    [[nodiscard]] auto category() const -> AssetCategory { return category_; }
    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    static auto CollectFiles_(const std::filesystem::path& root, bool recursive,
                              const std::unordered_set<std::string>& extensions,
                              std::vector<std::filesystem::path>& out) -> void;

private:
    AssetCategory category_;
    std::filesystem::path root_;
};

} // namespace motionlib
