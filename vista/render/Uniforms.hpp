#pragma once

#include <variant>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace vista::render
{
enum class UniformKind
{
    Mat4,
    Vec3,
    Vec2,
    Float
};

/// Uniform payload tagged with its kind so devices never have to guess the
/// GL upload call from the value shape.
struct UniformValue
{
    UniformKind kind = UniformKind::Float;
    std::variant<glm::mat4, glm::vec3, glm::vec2, float> value{0.0F};

    static UniformValue Mat4(const glm::mat4& matrix) { return UniformValue{UniformKind::Mat4, matrix}; }
    static UniformValue Vec3(const glm::vec3& vector) { return UniformValue{UniformKind::Vec3, vector}; }
    static UniformValue Vec2(const glm::vec2& vector) { return UniformValue{UniformKind::Vec2, vector}; }
    static UniformValue Float(float scalar) { return UniformValue{UniformKind::Float, scalar}; }

    [[nodiscard]] const glm::mat4& AsMat4() const { return std::get<glm::mat4>(value); }
    [[nodiscard]] const glm::vec3& AsVec3() const { return std::get<glm::vec3>(value); }
    [[nodiscard]] const glm::vec2& AsVec2() const { return std::get<glm::vec2>(value); }
    [[nodiscard]] float AsFloat() const { return std::get<float>(value); }
};
} // namespace vista::render
