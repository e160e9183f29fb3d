#pragma once

#include <glm/vec2.hpp>

#include "vista/scene/Scene.hpp"

namespace vista::platform
{
/// One frame of camera-relevant input, decoupled from GLFW so the controller
/// can be driven by tests.
struct CameraInputState
{
    bool dragging = false;
    bool panModifier = false;
    glm::vec2 mouseDelta{0.0F, 0.0F};
    // Pixel-style wheel delta, positive moves the camera away.
    float wheelDelta = 0.0F;

    bool moveForward = false;
    bool moveBack = false;
    bool moveLeft = false;
    bool moveRight = false;
    bool moveUp = false;
    bool moveDown = false;
};

/// Orbit-style camera manipulation: drag rotates, modifier-drag pans, the
/// wheel dollies and movement keys step the position at a fixed cadence.
class CameraController
{
public:
    static constexpr float kRotateSpeed = 0.01F;
    static constexpr float kPanSpeed = 0.1F;
    static constexpr float kWheelSpeed = 0.01F;
    static constexpr float kMoveSpeed = 0.1F;
    static constexpr double kMoveStepMs = 16.0;

    static constexpr float kMinHeight = 0.5F;
    static constexpr float kMaxPanHeight = 10.0F;
    static constexpr float kMinDistance = 1.0F;
    static constexpr float kMaxDistance = 20.0F;

    /// Applies |input| accumulated over |deltaMs|. Returns true if the camera changed.
    bool Update(scene::Camera& camera, const CameraInputState& input, double deltaMs);

    static void Rotate(scene::Camera& camera, glm::vec2 delta);
    static void Pan(scene::Camera& camera, glm::vec2 delta);
    static void Zoom(scene::Camera& camera, float wheelDelta);
    /// One fixed movement step. Returns false when no movement key is held.
    static bool Step(scene::Camera& camera, const CameraInputState& input);

    void Reset() { m_moveAccumulatorMs = 0.0; }

private:
    double m_moveAccumulatorMs = 0.0;
};
} // namespace vista::platform
