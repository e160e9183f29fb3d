#include "vista/platform/CameraController.hpp"

#include <algorithm>

#include "vista/math/Transform.hpp"

namespace vista::platform
{
bool CameraController::Update(scene::Camera& camera, const CameraInputState& input, double deltaMs)
{
    bool changed = false;

    if (input.dragging && (input.mouseDelta.x != 0.0F || input.mouseDelta.y != 0.0F))
    {
        if (input.panModifier)
        {
            Pan(camera, input.mouseDelta);
        }
        else
        {
            Rotate(camera, input.mouseDelta);
        }
        changed = true;
    }

    if (input.wheelDelta != 0.0F)
    {
        Zoom(camera, input.wheelDelta);
        changed = true;
    }

    m_moveAccumulatorMs += std::max(0.0, deltaMs);
    while (m_moveAccumulatorMs >= kMoveStepMs)
    {
        m_moveAccumulatorMs -= kMoveStepMs;
        changed = Step(camera, input) || changed;
    }

    return changed;
}

void CameraController::Rotate(scene::Camera& camera, glm::vec2 delta)
{
    const float halfPi = math::kPi * 0.5F;
    camera.rotation.x = std::clamp(camera.rotation.x + delta.y * kRotateSpeed, -halfPi, halfPi);
    camera.rotation.y += delta.x * kRotateSpeed;
}

void CameraController::Pan(scene::Camera& camera, glm::vec2 delta)
{
    camera.position.x += delta.x * kPanSpeed;
    camera.position.y = std::clamp(camera.position.y - delta.y * kPanSpeed, kMinHeight, kMaxPanHeight);
}

void CameraController::Zoom(scene::Camera& camera, float wheelDelta)
{
    camera.position.z = std::clamp(camera.position.z + wheelDelta * kWheelSpeed, kMinDistance, kMaxDistance);
}

bool CameraController::Step(scene::Camera& camera, const CameraInputState& input)
{
    bool moved = false;
    if (input.moveForward)
    {
        camera.position.z -= kMoveSpeed;
        moved = true;
    }
    if (input.moveBack)
    {
        camera.position.z += kMoveSpeed;
        moved = true;
    }
    if (input.moveLeft)
    {
        camera.position.x -= kMoveSpeed;
        moved = true;
    }
    if (input.moveRight)
    {
        camera.position.x += kMoveSpeed;
        moved = true;
    }
    if (input.moveUp)
    {
        camera.position.y += kMoveSpeed;
        moved = true;
    }
    if (input.moveDown)
    {
        camera.position.y = std::max(kMinHeight, camera.position.y - kMoveSpeed);
        moved = true;
    }
    return moved;
}
} // namespace vista::platform
