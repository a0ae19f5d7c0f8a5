#include "MeshBuilder.hpp"

#include <cstring>
#include <sstream>
#include <string>
#include <string_view>

#include "raymath.h"
#include "spdlog/spdlog.h"

namespace motionlib::thumb {
    namespace {
        constexpr auto kStlHeaderSize = 80uz;
        constexpr auto kStlTriangleSize = 50uz;

        float ReadFloat(const std::byte* data) {
            float value;
            std::memcpy(&value, data, sizeof(value));
            return value;
        }

        Vector3 ReadVector(const std::byte* data) {
            return Vector3{ReadFloat(data), ReadFloat(data + 4), ReadFloat(data + 8)};
        }

        bool IsBinaryStl(const std::span<const std::byte> bytes) {
            if (bytes.size() < kStlHeaderSize + 4) {
                return false;
            }
            uint32_t count;
            std::memcpy(&count, bytes.data() + kStlHeaderSize, sizeof(count));
            return bytes.size() == kStlHeaderSize + 4 + static_cast<size_t>(count) * kStlTriangleSize;
        }
    }

    Expected<TriangleSoup> MeshBuilder::readStl(const std::span<const std::byte> bytes) {
        TriangleSoup soup;

        if (IsBinaryStl(bytes)) {
            uint32_t count;
            std::memcpy(&count, bytes.data() + kStlHeaderSize, sizeof(count));
            soup.positions.reserve(static_cast<size_t>(count) * 9);
            soup.normals.reserve(static_cast<size_t>(count) * 9);

            const auto* triangle = bytes.data() + kStlHeaderSize + 4;
            for (uint32_t i = 0; i < count; ++i, triangle += kStlTriangleSize) {
                // Stored normals are frequently zero; faces are re-derived from the winding
                appendTriangle_(soup, ReadVector(triangle + 12), ReadVector(triangle + 24), ReadVector(triangle + 36));
            }
            return soup;
        }

        const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        if (!text.starts_with("solid")) {
            return Fail(ErrorKind::RenderFailure, "not an STL mesh");
        }

        std::istringstream stream{std::string(text)};
        std::string token;
        std::vector<Vector3> corners;
        while (stream >> token) {
            if (token != "vertex") {
                continue;
            }
            Vector3 v{};
            if (!(stream >> v.x >> v.y >> v.z)) {
                return Fail(ErrorKind::RenderFailure, "malformed vertex in ASCII STL");
            }
            corners.push_back(v);
            if (corners.size() == 3) {
                appendTriangle_(soup, corners[0], corners[1], corners[2]);
                corners.clear();
            }
        }
        if (soup.triangleCount() == 0) {
            return Fail(ErrorKind::RenderFailure, "STL mesh has no triangles");
        }
        return soup;
    }

    bool MeshBuilder::buildMesh(const TriangleSoup& soup, Mesh& mesh) {
        if (soup.triangleCount() == 0) {
            return false;
        }

        mesh = {};
        mesh.vertexCount = static_cast<int>(soup.triangleCount() * 3);
        mesh.triangleCount = static_cast<int>(soup.triangleCount());
        mesh.vertices = static_cast<float*>(MemAlloc(mesh.vertexCount * 3 * sizeof(float)));
        mesh.normals = static_cast<float*>(MemAlloc(mesh.vertexCount * 3 * sizeof(float)));

        if (!mesh.vertices || !mesh.normals) {
            UnloadMesh(mesh);
            return false;
        }

        std::memcpy(mesh.vertices, soup.positions.data(), soup.positions.size() * sizeof(float));
        std::memcpy(mesh.normals, soup.normals.data(), soup.normals.size() * sizeof(float));

        UploadMesh(&mesh, false);
        spdlog::debug("Uploaded mesh with {} triangles", mesh.triangleCount);
        return true;
    }

    bool MeshBuilder::hasGeometry(const Model& model) {
        if (model.meshCount <= 0 || model.meshes == nullptr) {
            return false;
        }
        for (int i = 0; i < model.meshCount; ++i) {
            const Mesh& mesh = model.meshes[i];
            if (mesh.vertexCount < 3 || mesh.vertices == nullptr) {
                return false;
            }
        }
        return true;
    }

    void MeshBuilder::appendTriangle_(TriangleSoup& soup, const Vector3& a, const Vector3& b, const Vector3& c) {
        const Vector3 normal = Vector3Normalize(Vector3CrossProduct(Vector3Subtract(b, a), Vector3Subtract(c, a)));
        for (const auto& v : {a, b, c}) {
            soup.positions.insert(soup.positions.end(), {v.x, v.y, v.z});
            soup.normals.insert(soup.normals.end(), {normal.x, normal.y, normal.z});
        }
    }
} // namespace motionlib::thumb
