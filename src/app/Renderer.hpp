#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../shared/Error.hpp"

namespace motionlib::thumb {
    constexpr auto kDefaultCameraDistance = 3.0f;
    constexpr auto kDefaultCameraAzimuth = 45.0f;      // degrees
    constexpr auto kDefaultCameraElevation = -20.0f;   // degrees, negative looks down
    constexpr auto kDefaultCameraLookat = std::array{0.0f, 0.0f, 1.0f};

    struct NamedCamera {
        std::string name;
    };

    struct OrbitCamera {
        float distance = kDefaultCameraDistance;
        float azimuth = kDefaultCameraAzimuth;
        float elevation = kDefaultCameraElevation;
        std::array<float, 3> lookat = kDefaultCameraLookat;
    };

    using CameraConfig = std::variant<NamedCamera, OrbitCamera>;

    struct RenderedImage {
        std::vector<std::byte> pixels;  // RGBA8, row-major, top row first
        uint32_t width = 0;
        uint32_t height = 0;
    };

    // Renderer-specific state of one loaded model document
    class ModelHandle {
    public:
        virtual ~ModelHandle() = default;
    };

    // Loads model documents, poses them without time integration and draws them from a
    // virtual camera. One instance per process; not thread-safe.
    class Renderer {
    public:
        virtual ~Renderer() = default;

        virtual auto loadModel(const std::filesystem::path& document) -> Expected<std::unique_ptr<ModelHandle>> = 0;
        virtual auto setPose(ModelHandle& handle, std::span<const double> pose) -> void = 0;
        virtual auto settle(ModelHandle& handle) -> void = 0;
        [[nodiscard]] virtual auto hasCamera(const ModelHandle& handle, std::string_view name) const -> bool = 0;
        virtual auto render(const ModelHandle& handle, const CameraConfig& camera, uint32_t width, uint32_t height)
            -> Expected<RenderedImage> = 0;
    };
} // namespace motionlib::thumb
