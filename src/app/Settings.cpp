#include "Settings.hpp"

#include <cstdlib>
#include <format>

#include "rfl/NoExtraFields.hpp"
#include "rfl/json.hpp"
#include "spdlog/spdlog.h"

namespace motionlib {

namespace {

std::optional<std::filesystem::path> FindSettingsFile(const std::filesystem::path& workingDirectory,
                                                      const std::filesystem::path& dataDir) {
    std::error_code ec;
    for (const auto& candidate : {workingDirectory / kSettingsFileName, dataDir / kSettingsFileName}) {
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

template<typename T>
void Override(std::optional<T>& target, const std::optional<T>& value) {
    if (value) {
        target = value;
    }
}

} // namespace

Expected<SettingsFile> ReadSettingsFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Fail(ErrorKind::InvalidInput, std::format("settings file {} does not exist", path.string()));
    }
    try {
        auto result = rfl::json::load<SettingsFile, rfl::NoExtraFields>(path.string());
        if (!result) {
            return Fail(ErrorKind::InvalidInput,
                        std::format("invalid settings file {}: {}", path.string(), result.error().what()));
        }
        return std::move(*result);
    }
    catch (const std::exception& e) {
        return Fail(ErrorKind::InvalidInput, std::format("invalid settings file {}: {}", path.string(), e.what()));
    }
}

Expected<ResolvedSettings> ResolveSettings(const SettingsOverrides& overrides,
                                           const std::filesystem::path& workingDirectory) {
    std::filesystem::path defaultDataDir = workingDirectory / kDefaultDataDir;
    if (const char* fromEnvironment = std::getenv(kDataDirEnvironment); fromEnvironment && *fromEnvironment) {
        defaultDataDir = fromEnvironment;
    }

    ResolvedSettings resolved;
    resolved.settingsFile = overrides.settingsFile;
    if (!resolved.settingsFile) {
        resolved.settingsFile = FindSettingsFile(workingDirectory, overrides.dataDir.value_or(defaultDataDir));
    }

    SettingsFile file;
    if (resolved.settingsFile) {
        auto loaded = ReadSettingsFile(*resolved.settingsFile);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        file = std::move(*loaded);
        spdlog::debug("Loaded settings from {}", resolved.settingsFile->string());
    }

    auto dataDir = defaultDataDir;
    if (file.dataDir) {
        dataDir = workingDirectory / *file.dataDir;
    }
    if (overrides.dataDir) {
        dataDir = overrides.dataDir->is_absolute() ? *overrides.dataDir : workingDirectory / *overrides.dataDir;
    }
    resolved.library = LibraryConfiguration::FromDataRoot(dataDir.lexically_normal());

    auto& render = resolved.render;
    render.thumbnailSize = overrides.thumbnailSize.value_or(file.thumbnailSize.value_or(thumb::kDefaultThumbnailSize));
    if (auto valid = thumb::ValidateThumbnailSize(render.thumbnailSize); !valid) {
        return std::unexpected(valid.error());
    }
    if (file.animationFormat) {
        if (*file.animationFormat == "gif") {
            render.animationFormat = thumb::AnimationFormat::Gif;
        }
        else if (*file.animationFormat != "webp") {
            return Fail(ErrorKind::InvalidInput,
                        std::format("animationFormat must be webp or gif, got '{}'", *file.animationFormat));
        }
    }
    if (const auto poseField = overrides.poseField ? overrides.poseField : file.poseField; poseField) {
        render.poseFields = {*poseField};
    }

    auto& camera = resolved.camera;
    if (file.camera) {
        camera.cameraName = file.camera->name;
        camera.distance = file.camera->distance;
        camera.azimuth = file.camera->azimuth;
        camera.elevation = file.camera->elevation;
        camera.lookat = file.camera->lookat;
    }
    Override(camera.cameraName, overrides.camera.cameraName);
    Override(camera.distance, overrides.camera.distance);
    Override(camera.azimuth, overrides.camera.azimuth);
    Override(camera.elevation, overrides.camera.elevation);
    Override(camera.lookat, overrides.camera.lookat);

    return resolved;
}

} // namespace motionlib
