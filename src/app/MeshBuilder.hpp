#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "../shared/Error.hpp"
#include "raylib.h"

namespace motionlib::thumb {
    // Unindexed triangles, three vertices per face, flat face normals
    struct TriangleSoup {
        std::vector<float> positions;
        std::vector<float> normals;

        [[nodiscard]] size_t triangleCount() const { return positions.size() / 9; }
    };

    class MeshBuilder {
    public:
        // Binary or ASCII STL
        static Expected<TriangleSoup> readStl(std::span<const std::byte> bytes);
        // Copies the soup into a raylib mesh and uploads it; needs an active GL context
        static bool buildMesh(const TriangleSoup& soup, Mesh& mesh);
        // False when a loaded model has no mesh carrying triangles, which is what raylib hands
        // back for a file it could not parse
        [[nodiscard]] static bool hasGeometry(const Model& model);

    private:
        static void appendTriangle_(TriangleSoup& soup, const Vector3& a, const Vector3& b, const Vector3& c);
    };
} // namespace motionlib::thumb
