#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace motionlib {

constexpr auto kAssetIdLength = 16uz;

// Truncated MD5 hex digest of a category-relative path. The path is hashed as given:
// callers pass the forward-slash form produced by CanonicalRelativePath so that the
// store, the cache and the render pipeline agree without a shared registry.
[[nodiscard]] std::string AssetId(std::string_view relativePath);

using AssetIdFunction = std::string (*)(std::string_view relativePath);

// Lexical path of `path` relative to `root`, forward-slash separated, no leading slash.
// Returns an empty string when `path` does not lie under `root`.
[[nodiscard]] std::string CanonicalRelativePath(const std::filesystem::path& root,
                                                const std::filesystem::path& path);

} // namespace motionlib
