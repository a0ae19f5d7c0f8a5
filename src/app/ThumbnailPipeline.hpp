#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/Error.hpp"
#include "../shared/entities.hpp"
#include "FrameSampler.hpp"
#include "ImageEncoder.hpp"
#include "Renderer.hpp"
#include "services/MotionLibrary.hpp"
#include "TrajectoryReader.hpp"

namespace motionlib::thumb {
    constexpr auto kDefaultThumbnailSize = 320u;
    constexpr auto kThumbnailSizes = std::array{160u, 320u};

    Expected<void> ValidateThumbnailSize(uint32_t size);

    struct RenderSettings {
        uint32_t thumbnailSize = kDefaultThumbnailSize;
        AnimationFormat animationFormat = AnimationFormat::Webp;
        std::vector<std::string> poseFields = kDefaultPoseFields;
    };

    // Unset fields take the default orbit framing
    struct CameraOptions {
        std::optional<std::string> cameraName;
        std::optional<float> distance;
        std::optional<float> azimuth;
        std::optional<float> elevation;
        std::optional<std::array<float, 3>> lookat;
    };

    struct BatchReport {
        size_t succeeded = 0;
        size_t total = 0;

        [[nodiscard]] size_t failed() const { return total - succeeded; }
        BatchReport& operator+=(const BatchReport& other) {
            succeeded += other.succeeded;
            total += other.total;
            return *this;
        }
    };

    // Offline thumbnail generation. Paths are relative to their category root; results land
    // in the thumbnail cache under the asset identifier, mirroring the asset's directory.
    // Runs sequentially on the caller's thread. Exceptions raised while rendering one asset
    // are reported as RenderFailure for that asset.
    class ThumbnailPipeline {
    public:
        ThumbnailPipeline(MotionLibrary& library, Renderer& renderer, RenderSettings settings = {});

        auto renderModel(const std::filesystem::path& modelPath, const CameraOptions& camera = {})
            -> Expected<std::filesystem::path>;
        auto renderTrajectory(const std::filesystem::path& trajectoryPath,
                              const std::filesystem::path& modelPath,
                              const CameraOptions& camera = {}) -> Expected<std::filesystem::path>;
        // Every .npy/.npz directly inside the folder; failures are logged and counted
        auto renderTrajectoryFolder(const std::filesystem::path& folderPath,
                                    const std::filesystem::path& modelPath,
                                    const CameraOptions& camera = {}) -> BatchReport;

        auto renderAllModels(const CameraOptions& camera = {}) -> BatchReport;
        // Without a model path the first listed model is used
        auto renderAllTrajectories(const std::optional<std::filesystem::path>& modelPath,
                                   const CameraOptions& camera = {}) -> Expected<BatchReport>;

        auto renderModelById(std::string_view id, const CameraOptions& camera = {}) -> Expected<std::filesystem::path>;
        auto renderTrajectoryById(std::string_view id,
                                  const std::filesystem::path& modelPath,
                                  const CameraOptions& camera = {}) -> Expected<std::filesystem::path>;

        [[nodiscard]] auto settings() const -> const RenderSettings& { return settings_; }

    private:
        auto renderModel_(const std::filesystem::path& modelPath, const CameraOptions& camera)
            -> Expected<std::filesystem::path>;
        auto renderTrajectory_(const std::filesystem::path& trajectoryPath,
                               const std::filesystem::path& modelPath,
                               const CameraOptions& camera) -> Expected<std::filesystem::path>;
        auto resolveAsset_(const AssetStore& store, const std::filesystem::path& relativePath) const
            -> Expected<AssetSummary>;
        auto loadModel_(const AssetSummary& model) -> Expected<std::unique_ptr<ModelHandle>>;
        [[nodiscard]] auto cameraFor_(const ModelHandle& handle, const CameraOptions& options,
                                      const AssetSummary& model) const -> CameraConfig;

        MotionLibrary& library_;
        Renderer& renderer_;
        RenderSettings settings_;
        TrajectoryReader reader_;
    };
} // namespace motionlib::thumb
