#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "ModelFactory.hpp"
#include "raylib.h"
#include "Renderer.hpp"

namespace motionlib::thumb {
    struct LoadedModelHandle;

    // raylib renderer drawing into an offscreen texture of a hidden window. Geoms are drawn
    // with a single directional light; bodies are posed by forward kinematics only.
    class ThumbnailRenderer final : public Renderer {
    public:
        ThumbnailRenderer();
        ~ThumbnailRenderer() override;

        ThumbnailRenderer(const ThumbnailRenderer&) = delete;
        ThumbnailRenderer& operator=(const ThumbnailRenderer&) = delete;

        auto loadModel(const std::filesystem::path& document) -> Expected<std::unique_ptr<ModelHandle>> override;
        auto setPose(ModelHandle& handle, std::span<const double> pose) -> void override;
        auto settle(ModelHandle& handle) -> void override;
        [[nodiscard]] auto hasCamera(const ModelHandle& handle, std::string_view name) const -> bool override;
        auto render(const ModelHandle& handle, const CameraConfig& camera, uint32_t width, uint32_t height)
            -> Expected<RenderedImage> override;

    private:
        bool ensureInitialized_();
        bool ensureTarget_(uint32_t width, uint32_t height);
        Expected<std::optional<Model>> loadMesh_(const MeshAsset& asset) const;
        [[nodiscard]] Camera3D camera_(const LoadedModelHandle& handle, const CameraConfig& config) const;
        void drawGeom_(const LoadedModelHandle& handle, const GeomSpec& geom, const Matrix& bodyWorld);
        void drawPrimitive_(const Mesh& mesh, const Matrix& transform, Color color);

        ModelFactory modelFactory_;
        bool initialized_ = false;
        Shader shader_{};
        Material material_{};
        Mesh sphere_{};
        Mesh cube_{};
        Mesh cylinder_{};
        Mesh plane_{};
        RenderTexture2D target_{};
    };
} // namespace motionlib::thumb
