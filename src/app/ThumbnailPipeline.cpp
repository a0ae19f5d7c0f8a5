#include "ThumbnailPipeline.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include "../shared/AssetId.hpp"
#include "spdlog/spdlog.h"
#include "Utils.hpp"

namespace motionlib::thumb {
    namespace {
        std::unexpected<Error> Failed(const AssetSummary& asset, Error error) {
            spdlog::warn("Thumbnail for {} (id {}) failed: {}", asset.relativePath, asset.id, error.message);
            return std::unexpected(std::move(error));
        }

        std::unexpected<Error> RenderFailed(const AssetSummary& asset, std::string message) {
            return Failed(asset, Error{.kind = ErrorKind::RenderFailure, .message = std::move(message)});
        }

        std::unexpected<Error> Aborted(const std::filesystem::path& asset, const std::exception& error) {
            spdlog::error("Thumbnail for {} aborted: {}", asset.generic_string(), error.what());
            return std::unexpected(Error{
                .kind = ErrorKind::RenderFailure,
                .message = std::format("rendering {} aborted: {}", asset.generic_string(), error.what())
            });
        }

        ThumbnailFormat StoredFormat(const AnimationFormat format) {
            return format == AnimationFormat::Gif ? ThumbnailFormat::Gif : ThumbnailFormat::Webp;
        }
    }

    Expected<void> ValidateThumbnailSize(const uint32_t size) {
        if (!std::ranges::contains(kThumbnailSizes, size)) {
            return Fail(ErrorKind::InvalidInput,
                        std::format("thumbnail size must be {} or {}, got {}", kThumbnailSizes[0], kThumbnailSizes[1], size));
        }
        return {};
    }

    ThumbnailPipeline::ThumbnailPipeline(MotionLibrary& library, Renderer& renderer, RenderSettings settings)
        : library_(library),
          renderer_(renderer),
          settings_(std::move(settings)),
          reader_(settings_.poseFields) {}

    auto ThumbnailPipeline::renderModel(const std::filesystem::path& modelPath, const CameraOptions& camera)
        -> Expected<std::filesystem::path> {
        try {
            return renderModel_(modelPath, camera);
        }
        catch (const std::exception& e) {
            return Aborted(modelPath, e);
        }
    }

    auto ThumbnailPipeline::renderTrajectory(const std::filesystem::path& trajectoryPath,
                                             const std::filesystem::path& modelPath,
                                             const CameraOptions& camera) -> Expected<std::filesystem::path> {
        try {
            return renderTrajectory_(trajectoryPath, modelPath, camera);
        }
        catch (const std::exception& e) {
            return Aborted(trajectoryPath, e);
        }
    }

    auto ThumbnailPipeline::renderModel_(const std::filesystem::path& modelPath, const CameraOptions& camera)
        -> Expected<std::filesystem::path> {
        auto model = resolveAsset_(library_.models(), modelPath);
        if (!model) {
            return std::unexpected(model.error());
        }

        auto handle = loadModel_(*model);
        if (!handle) {
            return Failed(*model, handle.error());
        }
        renderer_.settle(**handle);

        const auto size = settings_.thumbnailSize;
        auto frame = renderer_.render(**handle, cameraFor_(**handle, camera, *model), size, size);
        if (!frame) {
            return Failed(*model, frame.error());
        }
        auto encoded = EncodeStill(*frame);
        if (!encoded) {
            return Failed(*model, encoded.error());
        }

        auto stored = library_.thumbnails().Put(AssetCategory::Models, model->id,
                                                library_.models().thumbnailDirectory(*model),
                                                *encoded, ThumbnailFormat::Webp);
        if (!stored) {
            return Failed(*model, stored.error());
        }
        spdlog::info("Rendered model thumbnail for {} -> {}", model->relativePath, stored->string());
        return stored;
    }

    auto ThumbnailPipeline::renderTrajectory_(const std::filesystem::path& trajectoryPath,
                                              const std::filesystem::path& modelPath,
                                              const CameraOptions& camera) -> Expected<std::filesystem::path> {
        auto trajectory = resolveAsset_(library_.trajectories(), trajectoryPath);
        if (!trajectory) {
            return std::unexpected(trajectory.error());
        }
        auto model = resolveAsset_(library_.models(), modelPath);
        if (!model) {
            return Failed(*trajectory, model.error());
        }

        auto handle = loadModel_(*model);
        if (!handle) {
            return Failed(*trajectory, handle.error());
        }

        auto poses = reader_.read(library_.trajectories().root() / trajectory->relativePath);
        if (!poses) {
            return RenderFailed(*trajectory, poses.error().message);
        }
        const auto indices = SampleFrameIndices(poses->frameCount, kTrajectoryFrames);
        if (indices.empty()) {
            return RenderFailed(*trajectory, "trajectory has no frames");
        }

        const auto config = cameraFor_(**handle, camera, *model);
        const auto size = settings_.thumbnailSize;
        std::vector<RenderedImage> frames;
        frames.reserve(indices.size());
        for (const auto index : indices) {
            renderer_.setPose(**handle, poses->frame(index));
            renderer_.settle(**handle);
            auto frame = renderer_.render(**handle, config, size, size);
            if (!frame) {
                return Failed(*trajectory, frame.error());
            }
            frames.push_back(std::move(*frame));
        }
        spdlog::debug("Rendered {} frames of {} ({} poses of dimension {})", frames.size(),
                      trajectory->relativePath, poses->frameCount, poses->dimension);

        auto encoded = EncodeAnimation(frames, settings_.animationFormat);
        if (!encoded) {
            return Failed(*trajectory, encoded.error());
        }

        auto stored = library_.thumbnails().Put(AssetCategory::Trajectories, trajectory->id,
                                                library_.trajectories().thumbnailDirectory(*trajectory),
                                                *encoded, StoredFormat(settings_.animationFormat));
        if (!stored) {
            return Failed(*trajectory, stored.error());
        }
        spdlog::info("Rendered trajectory thumbnail for {} with {} -> {}", trajectory->relativePath,
                     model->relativePath, stored->string());
        return stored;
    }

    auto ThumbnailPipeline::renderTrajectoryFolder(const std::filesystem::path& folderPath,
                                                   const std::filesystem::path& modelPath,
                                                   const CameraOptions& camera) -> BatchReport {
        BatchReport report;
        if (!folderPath.empty() && !IsSafeRelativePath(folderPath)) {
            spdlog::warn("Refusing to render folder outside the trajectory root: {}", folderPath.string());
            return report;
        }

        const auto& store = library_.trajectories();
        const auto files = store.locator().ListFolder(store.root() / folderPath);
        for (const auto& file : files) {
            ++report.total;
            if (renderTrajectory(CanonicalRelativePath(store.root(), file), modelPath, camera)) {
                ++report.succeeded;
            }
        }

        spdlog::info("Rendered {}/{} trajectories in {}", report.succeeded, report.total,
                     folderPath.empty() ? "." : folderPath.generic_string());
        return report;
    }

    auto ThumbnailPipeline::renderAllModels(const CameraOptions& camera) -> BatchReport {
        BatchReport report;
        for (const auto& model : library_.models().list()) {
            ++report.total;
            if (renderModel(model.relativePath, camera)) {
                ++report.succeeded;
            }
        }
        spdlog::info("Rendered {}/{} model thumbnails", report.succeeded, report.total);
        return report;
    }

    auto ThumbnailPipeline::renderAllTrajectories(const std::optional<std::filesystem::path>& modelPath,
                                                  const CameraOptions& camera) -> Expected<BatchReport> {
        std::filesystem::path model;
        if (modelPath) {
            model = *modelPath;
        }
        else {
            const auto models = library_.models().list();
            if (models.empty()) {
                return Fail(ErrorKind::NotFound, "no model available to render trajectories with");
            }
            model = models.front().relativePath;
            spdlog::info("Rendering trajectories with {}", model.generic_string());
        }

        BatchReport report;
        for (const auto& trajectory : library_.trajectories().list()) {
            ++report.total;
            if (renderTrajectory(trajectory.relativePath, model, camera)) {
                ++report.succeeded;
            }
        }
        spdlog::info("Rendered {}/{} trajectory thumbnails", report.succeeded, report.total);
        return report;
    }

    auto ThumbnailPipeline::renderModelById(const std::string_view id, const CameraOptions& camera)
        -> Expected<std::filesystem::path> {
        const auto model = library_.models().summary(id);
        if (!model) {
            return Fail(ErrorKind::NotFound, std::format("model {} not found", id));
        }
        return renderModel(model->relativePath, camera);
    }

    auto ThumbnailPipeline::renderTrajectoryById(const std::string_view id,
                                                 const std::filesystem::path& modelPath,
                                                 const CameraOptions& camera) -> Expected<std::filesystem::path> {
        const auto trajectory = library_.trajectories().summary(id);
        if (!trajectory) {
            return Fail(ErrorKind::NotFound, std::format("trajectory {} not found", id));
        }
        return renderTrajectory(trajectory->relativePath, modelPath, camera);
    }

    auto ThumbnailPipeline::resolveAsset_(const AssetStore& store, const std::filesystem::path& relativePath) const
        -> Expected<AssetSummary> {
        const auto category = CategoryName(store.category());
        if (!IsSafeRelativePath(relativePath)) {
            return Fail(ErrorKind::InvalidInput,
                        std::format("{} path '{}' must be relative to its root", category, relativePath.string()));
        }
        if (!HasRecognizedExtension(store.category(), relativePath)) {
            return Fail(ErrorKind::InvalidInput,
                        std::format("'{}' is not a recognized {} file", relativePath.string(), category));
        }

        const auto file = store.root() / relativePath;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            return Fail(ErrorKind::NotFound, std::format("{} {} not found", category, relativePath.generic_string()));
        }
        auto summary = store.summarize(file);
        if (!summary) {
            return Fail(ErrorKind::NotFound, std::format("{} {} not found", category, relativePath.generic_string()));
        }
        return std::move(*summary);
    }

    auto ThumbnailPipeline::loadModel_(const AssetSummary& model) -> Expected<std::unique_ptr<ModelHandle>> {
        auto handle = renderer_.loadModel(library_.models().root() / model.relativePath);
        if (!handle) {
            return Fail(ErrorKind::RenderFailure, handle.error().message);
        }
        return handle;
    }

    auto ThumbnailPipeline::cameraFor_(const ModelHandle& handle, const CameraOptions& options,
                                       const AssetSummary& model) const -> CameraConfig {
        if (options.cameraName) {
            if (renderer_.hasCamera(handle, *options.cameraName)) {
                return NamedCamera{.name = *options.cameraName};
            }
            spdlog::warn("Camera '{}' not found in {}, using the orbit camera", *options.cameraName, model.relativePath);
        }
        return OrbitCamera{
            .distance = options.distance.value_or(kDefaultCameraDistance),
            .azimuth = options.azimuth.value_or(kDefaultCameraAzimuth),
            .elevation = options.elevation.value_or(kDefaultCameraElevation),
            .lookat = options.lookat.value_or(kDefaultCameraLookat)
        };
    }
} // namespace motionlib::thumb
