#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "vista/scene/Scene.hpp"

namespace vista::assets
{
struct MeshData
{
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec2> uvs;
    std::vector<std::uint32_t> indices;
    std::uint32_t triangleCount = 0;
};

[[nodiscard]] bool operator==(const MeshData& a, const MeshData& b);
[[nodiscard]] bool operator!=(const MeshData& a, const MeshData& b);

/// Sphere segment counts above this are malformed; keeps the vertex grid
/// addressable with 32-bit indices.
constexpr float kMaxSphereSegments = 1024.0F;

/// Builds primitive meshes on first request and memoizes them by
/// (type, parameters). Returned references stay valid until Clear().
class GeometryCache
{
public:
    const MeshData& Get(const scene::GeometryDescriptor& descriptor);

    [[nodiscard]] bool Contains(const scene::GeometryDescriptor& descriptor) const;
    [[nodiscard]] std::size_t Size() const { return m_cache.size(); }
    void Clear();

    /// "<type>_<parameters as compact JSON, keys sorted>".
    [[nodiscard]] static std::string MakeKey(const scene::GeometryDescriptor& descriptor);

    /// Unknown types and malformed parameters produce the unit box; the reason
    /// is written to |outFallbackReason| in that case.
    [[nodiscard]] static MeshData Build(const scene::GeometryDescriptor& descriptor, std::string* outFallbackReason = nullptr);

    [[nodiscard]] static MeshData CreateBox(float width, float height, float depth);
    [[nodiscard]] static MeshData CreateSphere(float radius, int widthSegments, int heightSegments);
    [[nodiscard]] static MeshData CreatePlane(float width, float height);

private:
    std::unordered_map<std::string, MeshData> m_cache;
};
} // namespace vista::assets
