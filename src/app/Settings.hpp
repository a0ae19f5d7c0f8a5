#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "../shared/Error.hpp"
#include "../shared/index.hpp"
#include "ThumbnailPipeline.hpp"

namespace motionlib {

constexpr auto kDataDirEnvironment = "MOTIONLIB_DATA_DIR";
constexpr auto kSettingsFileName = "motionlib.json";
constexpr auto kDefaultDataDir = "data";

// Values given on the command line; they win over motionlib.json
struct SettingsOverrides {
    std::optional<std::filesystem::path> dataDir;
    std::optional<std::filesystem::path> settingsFile;
    std::optional<uint32_t> thumbnailSize;
    std::optional<std::string> poseField;
    thumb::CameraOptions camera;
};

struct ResolvedSettings {
    LibraryConfiguration library;
    thumb::RenderSettings render;
    thumb::CameraOptions camera;
    std::optional<std::filesystem::path> settingsFile;
};

Expected<SettingsFile> ReadSettingsFile(const std::filesystem::path& path);

// Precedence: command line, then motionlib.json, then MOTIONLIB_DATA_DIR, then ./data.
// Without an explicit file, motionlib.json is looked up in the working directory and
// then in the data directory.
Expected<ResolvedSettings> ResolveSettings(const SettingsOverrides& overrides,
                                           const std::filesystem::path& workingDirectory = std::filesystem::current_path());

} // namespace motionlib
