#include "vista/assets/GeometryCache.hpp"

#include <cmath>
#include <iostream>

#include <nlohmann/json.hpp>

#include "vista/math/Transform.hpp"

namespace vista::assets
{
namespace
{
float Parameter(const scene::GeometryDescriptor& descriptor, const char* name, float fallback)
{
    const auto it = descriptor.parameters.find(name);
    return it != descriptor.parameters.end() ? it->second : fallback;
}

bool AllParametersFinite(const scene::GeometryDescriptor& descriptor)
{
    for (const auto& [name, value] : descriptor.parameters)
    {
        (void)name;
        if (!std::isfinite(value))
        {
            return false;
        }
    }
    return true;
}

void SetReason(std::string* outReason, const std::string& reason)
{
    if (outReason != nullptr)
    {
        *outReason = reason;
    }
}
} // namespace

bool operator==(const MeshData& a, const MeshData& b)
{
    return a.triangleCount == b.triangleCount
        && a.positions == b.positions
        && a.normals == b.normals
        && a.uvs == b.uvs
        && a.indices == b.indices;
}

bool operator!=(const MeshData& a, const MeshData& b)
{
    return !(a == b);
}

const MeshData& GeometryCache::Get(const scene::GeometryDescriptor& descriptor)
{
    const std::string key = MakeKey(descriptor);
    const auto existing = m_cache.find(key);
    if (existing != m_cache.end())
    {
        return existing->second;
    }

    std::string fallbackReason;
    MeshData built = Build(descriptor, &fallbackReason);
    if (!fallbackReason.empty())
    {
        std::cout << "[GeometryCache] " << key << ": " << fallbackReason << ", using unit box.\n";
    }

    const auto [it, inserted] = m_cache.emplace(key, std::move(built));
    (void)inserted;
    return it->second;
}

bool GeometryCache::Contains(const scene::GeometryDescriptor& descriptor) const
{
    return m_cache.find(MakeKey(descriptor)) != m_cache.end();
}

void GeometryCache::Clear()
{
    m_cache.clear();
}

std::string GeometryCache::MakeKey(const scene::GeometryDescriptor& descriptor)
{
    nlohmann::json parameters = nlohmann::json::object();
    for (const auto& [name, value] : descriptor.parameters)
    {
        // NaN/inf have no JSON form; keep them distinguishable in the key.
        if (std::isfinite(value))
        {
            parameters[name] = value;
        }
        else
        {
            parameters[name] = std::isnan(value) ? "nan" : (value > 0.0F ? "inf" : "-inf");
        }
    }
    return descriptor.type + "_" + parameters.dump();
}

MeshData GeometryCache::Build(const scene::GeometryDescriptor& descriptor, std::string* outFallbackReason)
{
    const bool finite = AllParametersFinite(descriptor);

    if (descriptor.type == "box")
    {
        const float width = Parameter(descriptor, "width", 1.0F);
        const float height = Parameter(descriptor, "height", 1.0F);
        const float depth = Parameter(descriptor, "depth", 1.0F);
        if (finite && width > 0.0F && height > 0.0F && depth > 0.0F)
        {
            return CreateBox(width, height, depth);
        }
        SetReason(outFallbackReason, "invalid box extents");
    }
    else if (descriptor.type == "sphere")
    {
        const float radius = Parameter(descriptor, "radius", 0.5F);
        const float widthSegments = std::floor(Parameter(descriptor, "widthSegments", 32.0F));
        const float heightSegments = std::floor(Parameter(descriptor, "heightSegments", 16.0F));
        // One height segment collapses every row into a pole and leaves no triangles.
        if (finite && radius > 0.0F && widthSegments >= 1.0F && heightSegments >= 2.0F
            && widthSegments <= kMaxSphereSegments && heightSegments <= kMaxSphereSegments)
        {
            return CreateSphere(radius, static_cast<int>(widthSegments), static_cast<int>(heightSegments));
        }
        SetReason(outFallbackReason, "invalid sphere parameters");
    }
    else if (descriptor.type == "plane")
    {
        const float width = Parameter(descriptor, "width", 1.0F);
        const float height = Parameter(descriptor, "height", 1.0F);
        if (finite && width > 0.0F && height > 0.0F)
        {
            return CreatePlane(width, height);
        }
        SetReason(outFallbackReason, "invalid plane extents");
    }
    else
    {
        SetReason(outFallbackReason, "unsupported geometry type '" + descriptor.type + "'");
    }

    return CreateBox(1.0F, 1.0F, 1.0F);
}

MeshData GeometryCache::CreateBox(float width, float height, float depth)
{
    const float w = width * 0.5F;
    const float h = height * 0.5F;
    const float d = depth * 0.5F;

    MeshData mesh;
    mesh.positions = {
        // Front
        {-w, -h, d}, {w, -h, d}, {w, h, d}, {-w, h, d},
        // Back
        {-w, -h, -d}, {-w, h, -d}, {w, h, -d}, {w, -h, -d},
        // Top
        {-w, h, -d}, {-w, h, d}, {w, h, d}, {w, h, -d},
        // Bottom
        {-w, -h, -d}, {w, -h, -d}, {w, -h, d}, {-w, -h, d},
        // Right
        {w, -h, -d}, {w, h, -d}, {w, h, d}, {w, -h, d},
        // Left
        {-w, -h, -d}, {-w, -h, d}, {-w, h, d}, {-w, h, -d},
    };

    const glm::vec3 faceNormals[6] = {
        {0.0F, 0.0F, 1.0F},
        {0.0F, 0.0F, -1.0F},
        {0.0F, 1.0F, 0.0F},
        {0.0F, -1.0F, 0.0F},
        {1.0F, 0.0F, 0.0F},
        {-1.0F, 0.0F, 0.0F},
    };
    mesh.normals.reserve(24);
    for (const glm::vec3& normal : faceNormals)
    {
        mesh.normals.insert(mesh.normals.end(), 4, normal);
    }

    mesh.uvs = {
        {0.0F, 0.0F}, {1.0F, 0.0F}, {1.0F, 1.0F}, {0.0F, 1.0F}, // Front
        {1.0F, 0.0F}, {1.0F, 1.0F}, {0.0F, 1.0F}, {0.0F, 0.0F}, // Back
        {0.0F, 1.0F}, {0.0F, 0.0F}, {1.0F, 0.0F}, {1.0F, 1.0F}, // Top
        {1.0F, 1.0F}, {0.0F, 1.0F}, {0.0F, 0.0F}, {1.0F, 0.0F}, // Bottom
        {1.0F, 0.0F}, {1.0F, 1.0F}, {0.0F, 1.0F}, {0.0F, 0.0F}, // Right
        {0.0F, 0.0F}, {1.0F, 0.0F}, {1.0F, 1.0F}, {0.0F, 1.0F}, // Left
    };

    mesh.indices.reserve(36);
    for (std::uint32_t face = 0; face < 6; ++face)
    {
        const std::uint32_t base = face * 4U;
        mesh.indices.insert(mesh.indices.end(), {base, base + 1U, base + 2U, base, base + 2U, base + 3U});
    }

    mesh.triangleCount = 12;
    return mesh;
}

MeshData GeometryCache::CreateSphere(float radius, int widthSegments, int heightSegments)
{
    MeshData mesh;
    const std::size_t vertexCount = static_cast<std::size_t>(heightSegments + 1) * static_cast<std::size_t>(widthSegments + 1);
    mesh.positions.reserve(vertexCount);
    mesh.normals.reserve(vertexCount);
    mesh.uvs.reserve(vertexCount);

    for (int y = 0; y <= heightSegments; ++y)
    {
        const float v = static_cast<float>(y) / static_cast<float>(heightSegments);
        const float theta = v * math::kPi;

        for (int x = 0; x <= widthSegments; ++x)
        {
            const float u = static_cast<float>(x) / static_cast<float>(widthSegments);
            const float phi = u * math::kPi * 2.0F;

            const glm::vec3 position{
                -radius * std::cos(phi) * std::sin(theta),
                radius * std::cos(theta),
                radius * std::sin(phi) * std::sin(theta),
            };
            mesh.positions.push_back(position);
            mesh.normals.push_back(position / radius);
            mesh.uvs.emplace_back(u, 1.0F - v);
        }
    }

    const std::uint32_t rowStride = static_cast<std::uint32_t>(widthSegments) + 1U;
    for (int y = 0; y < heightSegments; ++y)
    {
        for (int x = 0; x < widthSegments; ++x)
        {
            const std::uint32_t a = static_cast<std::uint32_t>(y) * rowStride + static_cast<std::uint32_t>(x);
            const std::uint32_t b = a + rowStride;
            const std::uint32_t c = a + 1U;
            const std::uint32_t d = b + 1U;

            // The first and last rows collapse into the poles.
            if (y != 0)
            {
                mesh.indices.insert(mesh.indices.end(), {a, b, c});
            }
            if (y != heightSegments - 1)
            {
                mesh.indices.insert(mesh.indices.end(), {b, d, c});
            }
        }
    }

    mesh.triangleCount = static_cast<std::uint32_t>(mesh.indices.size() / 3U);
    return mesh;
}

MeshData GeometryCache::CreatePlane(float width, float height)
{
    const float w = width * 0.5F;
    const float h = height * 0.5F;

    MeshData mesh;
    mesh.positions = {{-w, -h, 0.0F}, {w, -h, 0.0F}, {w, h, 0.0F}, {-w, h, 0.0F}};
    mesh.normals.assign(4, glm::vec3{0.0F, 0.0F, 1.0F});
    mesh.uvs = {{0.0F, 0.0F}, {1.0F, 0.0F}, {1.0F, 1.0F}, {0.0F, 1.0F}};
    mesh.indices = {0, 1, 2, 0, 2, 3};
    mesh.triangleCount = 2;
    return mesh;
}
} // namespace vista::assets
