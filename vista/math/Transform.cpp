#include "vista/math/Transform.hpp"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

namespace vista::math
{
glm::vec3 Normalize(const glm::vec3& value)
{
    const float length = std::sqrt(Dot(value, value));
    if (length <= 0.0F)
    {
        return glm::vec3{0.0F};
    }
    return glm::vec3{value.x / length, value.y / length, value.z / length};
}

glm::vec3 Subtract(const glm::vec3& a, const glm::vec3& b)
{
    return glm::vec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

glm::vec3 Cross(const glm::vec3& a, const glm::vec3& b)
{
    return glm::vec3{
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x,
    };
}

float Dot(const glm::vec3& a, const glm::vec3& b)
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

glm::mat4 Perspective(float fovDegrees, float aspect, float zNear, float zFar)
{
    const float safeAspect = aspect > 0.0F ? aspect : 1.0F;
    const float f = 1.0F / std::tan(fovDegrees * kPi / 360.0F);
    const float nf = 1.0F / (zNear - zFar);

    // glm is column-major: m[column][row].
    glm::mat4 result{0.0F};
    result[0][0] = f / safeAspect;
    result[1][1] = f;
    result[2][2] = (zFar + zNear) * nf;
    result[2][3] = -1.0F;
    result[3][2] = 2.0F * zFar * zNear * nf;
    return result;
}

glm::mat4 LookAt(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
{
    const glm::vec3 zAxis = Normalize(Subtract(eye, target));
    const glm::vec3 xAxis = Normalize(Cross(up, zAxis));
    const glm::vec3 yAxis = Cross(zAxis, xAxis);

    glm::mat4 result{1.0F};
    result[0][0] = xAxis.x;
    result[1][0] = xAxis.y;
    result[2][0] = xAxis.z;
    result[0][1] = yAxis.x;
    result[1][1] = yAxis.y;
    result[2][1] = yAxis.z;
    result[0][2] = zAxis.x;
    result[1][2] = zAxis.y;
    result[2][2] = zAxis.z;
    result[3][0] = -Dot(xAxis, eye);
    result[3][1] = -Dot(yAxis, eye);
    result[3][2] = -Dot(zAxis, eye);
    return result;
}

glm::mat4 Multiply(const glm::mat4& a, const glm::mat4& b)
{
    return a * b;
}

glm::mat4 EulerRotationMatrix(const glm::vec3& rotationRadians)
{
    glm::mat4 transform{1.0F};
    transform = glm::rotate(transform, rotationRadians.y, glm::vec3{0.0F, 1.0F, 0.0F});
    transform = glm::rotate(transform, rotationRadians.x, glm::vec3{1.0F, 0.0F, 0.0F});
    transform = glm::rotate(transform, rotationRadians.z, glm::vec3{0.0F, 0.0F, 1.0F});
    return transform;
}

glm::mat4 ComposeModelMatrix(const Transform& transform)
{
    const glm::mat4 translation = glm::translate(glm::mat4{1.0F}, transform.position);
    const glm::mat4 rotation = EulerRotationMatrix(transform.rotation);
    const glm::mat4 scale = glm::scale(glm::mat4{1.0F}, transform.scale);
    return Multiply(translation, Multiply(rotation, scale));
}

glm::mat4 NormalMatrix(const Transform& transform)
{
    const glm::mat4 rotation = EulerRotationMatrix(transform.rotation);
    const glm::vec3& s = transform.scale;
    if (s.x == 0.0F || s.y == 0.0F || s.z == 0.0F)
    {
        return rotation;
    }
    return Multiply(rotation, glm::scale(glm::mat4{1.0F}, glm::vec3{1.0F / s.x, 1.0F / s.y, 1.0F / s.z}));
}
} // namespace vista::math
