#include "ThumbnailRenderer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <format>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "MeshBuilder.hpp"
#include "raymath.h"
#include "rlgl.h"
#include "spdlog/spdlog.h"
#include "Utils.hpp"

namespace motionlib::thumb {
    namespace {
        constexpr auto kDefaultFovy = 45.0f;
        constexpr auto kInfinitePlaneHalfSize = 5.0f;
        constexpr auto kMaxElevation = 89.0f;
        constexpr Color kBackground{38, 42, 51, 255};
        constexpr Vector3 kLightDirection{-0.4f, -0.3f, -0.85f};

        constexpr auto kVertexShader = R"(#version 330
in vec3 vertexPosition;
in vec3 vertexNormal;
uniform mat4 mvp;
uniform mat4 matNormal;
out vec3 fragNormal;
void main() {
    fragNormal = normalize(vec3(matNormal * vec4(vertexNormal, 0.0)));
    gl_Position = mvp * vec4(vertexPosition, 1.0);
}
)";

        constexpr auto kFragmentShader = R"(#version 330
in vec3 fragNormal;
uniform vec4 colDiffuse;
uniform vec3 lightDirection;
out vec4 finalColor;
void main() {
    float diffuse = abs(dot(normalize(fragNormal), -lightDirection));
    finalColor = vec4(colDiffuse.rgb * (0.35 + 0.65 * diffuse), colDiffuse.a);
}
)";

        std::string LowerExtension(const std::filesystem::path& path) {
            auto extension = path.extension().string();
            std::ranges::transform(extension, extension.begin(),
                                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return extension;
        }

        bool IsRaylibModelFormat(const std::string& extension) {
            static const auto kFormats = std::unordered_set<std::string>{".obj", ".gltf", ".glb", ".iqm", ".vox", ".m3d"};
            return kFormats.contains(extension);
        }
    }

    struct LoadedModelHandle final : ModelHandle {
        KinematicModel model;
        std::vector<double> qpos;
        std::vector<Matrix> bodyWorld;
        std::unordered_map<std::string, Model> meshes;

        ~LoadedModelHandle() override {
            for (const auto& [name, mesh] : meshes) {
                if (mesh.meshCount > 0) {
                    UnloadModel(mesh);
                }
            }
        }
    };

    ThumbnailRenderer::ThumbnailRenderer() = default;

    ThumbnailRenderer::~ThumbnailRenderer() {
        if (initialized_) {
            if (target_.id != 0) {
                UnloadRenderTexture(target_);
            }
            UnloadMesh(sphere_);
            UnloadMesh(cube_);
            UnloadMesh(cylinder_);
            UnloadMesh(plane_);
            UnloadMaterial(material_);
            CloseWindow();
        }
    }

    auto ThumbnailRenderer::loadModel(const std::filesystem::path& document) -> Expected<std::unique_ptr<ModelHandle>> {
        if (!ensureInitialized_()) {
            return Fail(ErrorKind::RenderFailure, "thumbnail renderer failed to initialize raylib");
        }

        auto model = modelFactory_.build(document);
        if (!model) {
            return std::unexpected(model.error());
        }

        auto handle = std::make_unique<LoadedModelHandle>();
        handle->model = std::move(*model);
        handle->qpos = handle->model.qpos0;

        for (const auto& body : handle->model.bodies) {
            for (const auto& geom : body.geoms) {
                if (geom.shape != GeomShape::Mesh || handle->meshes.contains(geom.mesh)) {
                    continue;
                }
                const auto* asset = handle->model.findMesh(geom.mesh);
                if (!asset) {
                    return Fail(ErrorKind::RenderFailure,
                                std::format("{}: geom references unknown mesh '{}'", document.filename().string(), geom.mesh));
                }
                auto loaded = loadMesh_(*asset);
                if (!loaded) {
                    return std::unexpected(loaded.error());
                }
                if (*loaded) {
                    handle->meshes.emplace(geom.mesh, **loaded);
                }
            }
        }

        handle->bodyWorld = ComputeBodyTransforms(handle->model, handle->qpos);
        return std::unique_ptr<ModelHandle>(std::move(handle));
    }

    auto ThumbnailRenderer::setPose(ModelHandle& handle, const std::span<const double> pose) -> void {
        auto& loaded = static_cast<LoadedModelHandle&>(handle);
        const auto count = std::min(pose.size(), loaded.qpos.size());
        std::copy_n(pose.begin(), count, loaded.qpos.begin());
    }

    auto ThumbnailRenderer::settle(ModelHandle& handle) -> void {
        auto& loaded = static_cast<LoadedModelHandle&>(handle);
        loaded.bodyWorld = ComputeBodyTransforms(loaded.model, loaded.qpos);
    }

    auto ThumbnailRenderer::hasCamera(const ModelHandle& handle, const std::string_view name) const -> bool {
        return static_cast<const LoadedModelHandle&>(handle).model.findCamera(name).has_value();
    }

    auto ThumbnailRenderer::render(const ModelHandle& handle, const CameraConfig& camera, const uint32_t width,
                                   const uint32_t height) -> Expected<RenderedImage> {
        if (width == 0 || height == 0) {
            return Fail(ErrorKind::RenderFailure, "render size must be positive");
        }
        if (!ensureInitialized_()) {
            return Fail(ErrorKind::RenderFailure, "thumbnail renderer failed to initialize raylib");
        }
        if (!ensureTarget_(width, height)) {
            return Fail(ErrorKind::RenderFailure, std::format("cannot create a {}x{} render target", width, height));
        }

        const auto& loaded = static_cast<const LoadedModelHandle&>(handle);
        const Camera3D view = camera_(loaded, camera);

        BeginTextureMode(target_);
        ClearBackground(kBackground);
        BeginMode3D(view);
        rlDisableBackfaceCulling();
        for (size_t i = 0; i < loaded.model.bodies.size(); ++i) {
            for (const auto& geom : loaded.model.bodies[i].geoms) {
                drawGeom_(loaded, geom, loaded.bodyWorld[i]);
            }
        }
        rlEnableBackfaceCulling();
        EndMode3D();
        EndTextureMode();

        Image image = LoadImageFromTexture(target_.texture);
        ImageFlipVertical(&image);
        ImageFormat(&image, PIXELFORMAT_UNCOMPRESSED_R8G8B8A8);

        RenderedImage rendered;
        rendered.width = width;
        rendered.height = height;
        rendered.pixels.resize(static_cast<size_t>(width) * height * 4);
        const bool complete = image.data && image.width == static_cast<int>(width) &&
                              image.height == static_cast<int>(height);
        if (complete) {
            std::memcpy(rendered.pixels.data(), image.data, rendered.pixels.size());
        }
        UnloadImage(image);

        if (!complete) {
            return Fail(ErrorKind::RenderFailure, "could not read back the rendered frame");
        }
        return rendered;
    }

    bool ThumbnailRenderer::ensureInitialized_() {
        if (initialized_) {
            return true;
        }

        SetTraceLogLevel(LOG_WARNING);
        SetConfigFlags(FLAG_WINDOW_HIDDEN);
        InitWindow(1, 1, "motionlib-thumbnails");
        if (!IsWindowReady()) {
            return false;
        }

        shader_ = LoadShaderFromMemory(kVertexShader, kFragmentShader);
        if (shader_.id == rlGetShaderIdDefault()) {
            spdlog::warn("Lighting shader failed to compile, rendering unlit");
        }
        else {
            SetShaderValue(shader_, GetShaderLocation(shader_, "lightDirection"), &kLightDirection, SHADER_UNIFORM_VEC3);
        }
        material_ = LoadMaterialDefault();
        material_.shader = shader_;

        sphere_ = GenMeshSphere(1.0f, 16, 24);
        cube_ = GenMeshCube(2.0f, 2.0f, 2.0f);
        cylinder_ = GenMeshCylinder(1.0f, 1.0f, 24);
        plane_ = GenMeshPlane(1.0f, 1.0f, 1, 1);

        initialized_ = true;
        return true;
    }

    bool ThumbnailRenderer::ensureTarget_(const uint32_t width, const uint32_t height) {
        if (target_.id != 0 && target_.texture.width == static_cast<int>(width) &&
            target_.texture.height == static_cast<int>(height)) {
            return true;
        }
        if (target_.id != 0) {
            UnloadRenderTexture(target_);
        }
        target_ = LoadRenderTexture(static_cast<int>(width), static_cast<int>(height));
        return target_.id != 0;
    }

    Expected<std::optional<Model>> ThumbnailRenderer::loadMesh_(const MeshAsset& asset) const {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(asset.file, ec)) {
            return Fail(ErrorKind::RenderFailure, std::format("missing mesh file {}", asset.file.string()));
        }

        const auto extension = LowerExtension(asset.file);
        if (extension == ".stl") {
            auto bytes = ReadFileBytes(asset.file);
            if (!bytes) {
                return Fail(ErrorKind::RenderFailure, bytes.error().message);
            }
            auto soup = MeshBuilder::readStl(*bytes);
            if (!soup) {
                return Fail(ErrorKind::RenderFailure, std::format("{}: {}", asset.file.string(), soup.error().message));
            }
            Mesh mesh{};
            if (!MeshBuilder::buildMesh(*soup, mesh)) {
                return Fail(ErrorKind::RenderFailure, std::format("cannot upload mesh {}", asset.file.string()));
            }
            return std::optional<Model>{LoadModelFromMesh(mesh)};
        }

        if (IsRaylibModelFormat(extension)) {
            Model model = LoadModel(asset.file.string().c_str());
            if (!MeshBuilder::hasGeometry(model)) {
                UnloadModel(model);
                return Fail(ErrorKind::RenderFailure, std::format("cannot load mesh {}", asset.file.string()));
            }
            return std::optional<Model>{model};
        }

        spdlog::warn("Mesh format of {} is not supported, skipping its geoms", asset.file.filename().string());
        return std::optional<Model>{};
    }

    Camera3D ThumbnailRenderer::camera_(const LoadedModelHandle& handle, const CameraConfig& config) const {
        Camera3D camera{};
        camera.projection = CAMERA_PERSPECTIVE;
        camera.fovy = kDefaultFovy;
        camera.up = Vector3{0.0f, 0.0f, 1.0f};

        if (const auto* named = std::get_if<NamedCamera>(&config)) {
            if (const auto ref = handle.model.findCamera(named->name)) {
                const auto& spec = handle.model.bodies[ref->body].cameras[ref->camera];
                const Matrix world = MatrixMultiply(spec.local, handle.bodyWorld[ref->body]);
                // MJCF cameras look along their local -Z axis with +Y up
                camera.position = Vector3{world.m12, world.m13, world.m14};
                camera.target = Vector3Subtract(camera.position, Vector3{world.m8, world.m9, world.m10});
                camera.up = Vector3{world.m4, world.m5, world.m6};
                camera.fovy = spec.fovy;
                return camera;
            }
        }

        const OrbitCamera orbit = std::holds_alternative<OrbitCamera>(config) ? std::get<OrbitCamera>(config) : OrbitCamera{};
        const auto azimuth = orbit.azimuth * DEG2RAD;
        const auto elevation = std::clamp(orbit.elevation, -kMaxElevation, kMaxElevation) * DEG2RAD;
        const Vector3 forward{
            std::cos(elevation) * std::cos(azimuth),
            std::cos(elevation) * std::sin(azimuth),
            std::sin(elevation)
        };
        camera.target = Vector3{orbit.lookat[0], orbit.lookat[1], orbit.lookat[2]};
        camera.position = Vector3Subtract(camera.target, Vector3Scale(forward, orbit.distance));
        return camera;
    }

    void ThumbnailRenderer::drawGeom_(const LoadedModelHandle& handle, const GeomSpec& geom, const Matrix& bodyWorld) {
        const Matrix world = MatrixMultiply(geom.local, bodyWorld);
        const auto& size = geom.size;

        switch (geom.shape) {
            case GeomShape::Sphere:
                drawPrimitive_(sphere_, MatrixMultiply(MatrixScale(size.x, size.x, size.x), world), geom.color);
                break;
            case GeomShape::Ellipsoid:
                drawPrimitive_(sphere_, MatrixMultiply(MatrixScale(size.x, size.y, size.z), world), geom.color);
                break;
            case GeomShape::Box:
                drawPrimitive_(cube_, MatrixMultiply(MatrixScale(size.x, size.y, size.z), world), geom.color);
                break;
            case GeomShape::Cylinder:
            case GeomShape::Capsule: {
                // The generated cylinder spans [0, 1] along +Y; geoms extend along local Z
                const Matrix shaft = MatrixMultiply(
                    MatrixMultiply(MatrixMultiply(MatrixTranslate(0.0f, -0.5f, 0.0f),
                                                  MatrixScale(size.x, 2.0f * size.y, size.x)),
                                   MatrixRotateX(PI / 2.0f)),
                    world);
                drawPrimitive_(cylinder_, shaft, geom.color);
                if (geom.shape == GeomShape::Capsule) {
                    const Matrix radius = MatrixScale(size.x, size.x, size.x);
                    drawPrimitive_(sphere_, MatrixMultiply(MatrixMultiply(radius, MatrixTranslate(0.0f, 0.0f, size.y)), world),
                                   geom.color);
                    drawPrimitive_(sphere_, MatrixMultiply(MatrixMultiply(radius, MatrixTranslate(0.0f, 0.0f, -size.y)), world),
                                   geom.color);
                }
                break;
            }
            case GeomShape::Plane: {
                const auto halfX = size.x > 0.0f ? size.x : kInfinitePlaneHalfSize;
                const auto halfY = size.y > 0.0f ? size.y : kInfinitePlaneHalfSize;
                const Matrix plane = MatrixMultiply(
                    MatrixMultiply(MatrixScale(2.0f * halfX, 1.0f, 2.0f * halfY), MatrixRotateX(PI / 2.0f)), world);
                drawPrimitive_(plane_, plane, geom.color);
                break;
            }
            case GeomShape::Mesh: {
                const auto it = handle.meshes.find(geom.mesh);
                const auto* asset = handle.model.findMesh(geom.mesh);
                if (it == handle.meshes.end() || !asset) {
                    break;
                }
                const Matrix transform = MatrixMultiply(MatrixScale(asset->scale.x, asset->scale.y, asset->scale.z), world);
                for (int m = 0; m < it->second.meshCount; ++m) {
                    drawPrimitive_(it->second.meshes[m], transform, geom.color);
                }
                break;
            }
        }
    }

    void ThumbnailRenderer::drawPrimitive_(const Mesh& mesh, const Matrix& transform, const Color color) {
        material_.maps[MATERIAL_MAP_DIFFUSE].color = color;
        DrawMesh(mesh, material_, transform);
    }
} // namespace motionlib::thumb
