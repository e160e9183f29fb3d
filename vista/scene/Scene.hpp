#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "vista/math/Transform.hpp"

namespace vista::scene
{
enum class AnimationType
{
    Rotate,
    Float,
    Pulse,
    Unknown
};

struct AnimationSpec
{
    AnimationType type = AnimationType::Rotate;
    float speed = 1.0F;
    float amplitude = 0.0F;
};

struct Material
{
    glm::vec3 color{1.0F};
    float metallic = 0.0F;
    float roughness = 0.5F;
    std::optional<glm::vec3> emission;
};

/// Primitive descriptor. |type| is kept verbatim ("box", "sphere", "plane",
/// "custom" or anything else) so that unknown types still get their own cache key.
struct GeometryDescriptor
{
    std::string type = "box";
    std::map<std::string, float> parameters;
};

struct SceneObject
{
    std::string id;
    std::string name;
    math::Transform transform;
    Material material;
    GeometryDescriptor geometry;
    std::optional<AnimationSpec> animation;
    bool interactive = false;
};

struct DirectionalLight
{
    glm::vec3 color{1.0F};
    float intensity = 1.0F;
    glm::vec3 direction{10.0F, 10.0F, 10.0F};
};

struct FogSettings
{
    glm::vec3 color{0.0F};
    float nearDistance = 50.0F;
    float farDistance = 200.0F;
};

struct Scene
{
    std::string id;
    std::string name;
    glm::vec3 ambientColor{0.1F, 0.1F, 0.18F};
    DirectionalLight directionalLight;
    FogSettings fog;
    std::vector<SceneObject> objects;
};

struct Camera
{
    glm::vec3 position{0.0F, 2.0F, 5.0F};
    glm::vec3 rotation{0.0F};
    float fov = 60.0F;
};

/// "#rrggbb" or "rrggbb", case-insensitive. Anything else yields white.
[[nodiscard]] glm::vec3 ParseHexColor(const std::string& text);
[[nodiscard]] std::string FormatHexColor(const glm::vec3& color);

[[nodiscard]] AnimationType AnimationTypeFromString(const std::string& text);
[[nodiscard]] const char* AnimationTypeToString(AnimationType type);

[[nodiscard]] const SceneObject* FindObject(const Scene& scene, const std::string& objectId);
} // namespace vista::scene
