#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace motionlib {

struct LibraryConfiguration {
    std::filesystem::path dataRoot;
    std::filesystem::path trajectoriesRoot;
    std::filesystem::path modelsRoot;
    std::filesystem::path thumbnailsRoot;

    static LibraryConfiguration FromDataRoot(const std::filesystem::path& dataRoot) {
        return LibraryConfiguration{
            .dataRoot = dataRoot,
            .trajectoriesRoot = dataRoot / "trajectories",
            .modelsRoot = dataRoot / "models",
            .thumbnailsRoot = dataRoot / "thumbnails"
        };
    }
};

// Optional overrides read from motionlib.json; unknown keys are rejected
struct CameraSettingsFile {
    std::optional<std::string> name;
    std::optional<float> distance;
    std::optional<float> azimuth;
    std::optional<float> elevation;
    std::optional<std::array<float, 3>> lookat;
};

struct SettingsFile {
    std::optional<std::string> dataDir;
    std::optional<uint32_t> thumbnailSize;
    std::optional<std::string> animationFormat;  // "webp" (default) or "gif"
    std::optional<std::string> poseField;
    std::optional<CameraSettingsFile> camera;
};

} // namespace motionlib
