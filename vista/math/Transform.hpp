#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

namespace vista::math
{
constexpr float kPi = 3.14159265358979323846F;

/// Position, Euler rotation (radians: pitch, yaw, roll) and per-axis scale.
struct Transform
{
    glm::vec3 position{0.0F};
    glm::vec3 rotation{0.0F};
    glm::vec3 scale{1.0F};
};

/// Returns the zero vector for zero-length input instead of NaNs.
[[nodiscard]] glm::vec3 Normalize(const glm::vec3& value);
[[nodiscard]] glm::vec3 Subtract(const glm::vec3& a, const glm::vec3& b);
[[nodiscard]] glm::vec3 Cross(const glm::vec3& a, const glm::vec3& b);
[[nodiscard]] float Dot(const glm::vec3& a, const glm::vec3& b);

/// Right-handed OpenGL projection, f = 1 / tan(fov * pi / 360).
[[nodiscard]] glm::mat4 Perspective(float fovDegrees, float aspect, float zNear, float zFar);

/// View matrix with zAxis = normalize(eye - target).
[[nodiscard]] glm::mat4 LookAt(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up);

[[nodiscard]] glm::mat4 Multiply(const glm::mat4& a, const glm::mat4& b);

/// Ry * Rx * Rz.
[[nodiscard]] glm::mat4 EulerRotationMatrix(const glm::vec3& rotationRadians);

/// Translation * Ry * Rx * Rz * Scale, in exactly that order. Swapping the
/// rotation order changes on-screen orientation of multi-axis rotations.
[[nodiscard]] glm::mat4 ComposeModelMatrix(const Transform& transform);

/// Inverse-transpose of the upper 3x3 of ComposeModelMatrix (R * S^-1).
/// Falls back to the bare rotation when a scale component is zero.
[[nodiscard]] glm::mat4 NormalMatrix(const Transform& transform);
} // namespace vista::math
