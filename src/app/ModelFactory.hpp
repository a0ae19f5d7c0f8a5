#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/Error.hpp"
#include "raylib.h"

namespace motionlib::thumb {
    enum class JointType {
        Free,
        Ball,
        Slide,
        Hinge,
    };

    // Number of pose coordinates a joint consumes: 7, 4, 1 and 1
    constexpr auto JointQposSize(const JointType type) -> size_t {
        switch (type) {
            case JointType::Free: return 7;
            case JointType::Ball: return 4;
            case JointType::Slide:
            case JointType::Hinge: return 1;
        }
        return 0;
    }

    enum class GeomShape {
        Plane,
        Sphere,
        Capsule,
        Ellipsoid,
        Cylinder,
        Box,
        Mesh,
    };

    struct JointSpec {
        std::string name;
        JointType type = JointType::Hinge;
        Vector3 axis{0.0f, 0.0f, 1.0f};
        Vector3 anchor{0.0f, 0.0f, 0.0f};
        size_t qposAddress = 0;
    };

    // Capsules and cylinders extend along the local Z axis; `size` follows the MJCF meaning
    // per shape (radius, half-length or half-extents).
    struct GeomSpec {
        std::string name;
        GeomShape shape = GeomShape::Sphere;
        Vector3 size{0.0f, 0.0f, 0.0f};
        Matrix local{};
        Color color{128, 128, 128, 255};
        std::string mesh;
    };

    struct CameraSpec {
        std::string name;
        Matrix local{};
        float fovy = 45.0f;
    };

    struct BodySpec {
        std::string name;
        int parent = -1;
        Matrix local{};
        std::vector<JointSpec> joints;
        std::vector<GeomSpec> geoms;
        std::vector<CameraSpec> cameras;
    };

    struct MeshAsset {
        std::string name;
        std::filesystem::path file;
        Vector3 scale{1.0f, 1.0f, 1.0f};
    };

    struct CameraRef {
        size_t body = 0;
        size_t camera = 0;
    };

    // Kinematic tree of an MJCF document. Body 0 is the world body; parents always precede
    // their children.
    struct KinematicModel {
        std::string name;
        std::vector<BodySpec> bodies;
        std::vector<MeshAsset> meshes;
        std::vector<double> qpos0;

        [[nodiscard]] size_t qposSize() const { return qpos0.size(); }
        [[nodiscard]] std::optional<CameraRef> findCamera(std::string_view name) const;
        [[nodiscard]] const MeshAsset* findMesh(std::string_view name) const;
    };

    class ModelFactory {
    public:
        [[nodiscard]] Expected<KinematicModel> build(const std::filesystem::path& document) const;
        // `baseDirectory` resolves includes and mesh files
        [[nodiscard]] Expected<KinematicModel> build(const std::string& xml,
                                                     const std::filesystem::path& baseDirectory) const;
    };

    // World transform of every body for the given pose. Missing coordinates keep their
    // rest value; extra coordinates are ignored.
    std::vector<Matrix> ComputeBodyTransforms(const KinematicModel& model, std::span<const double> qpos);
} // namespace motionlib::thumb
