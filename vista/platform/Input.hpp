#pragma once

#include <array>

#include <glm/vec2.hpp>

namespace vista::platform
{
class Window;

/// Per-frame keyboard, mouse and scroll snapshot polled from a Window.
class Input
{
public:
    void Update(Window& window);

    [[nodiscard]] bool IsKeyDown(int key) const;
    [[nodiscard]] bool IsKeyPressed(int key) const;
    [[nodiscard]] bool IsMouseDown(int button) const;
    [[nodiscard]] bool IsMousePressed(int button) const;

    [[nodiscard]] glm::vec2 MouseDelta() const { return m_mouseDelta; }
    [[nodiscard]] float ScrollDelta() const { return m_scrollDelta; }

private:
    static constexpr int kFirstKey = 32;
    static constexpr int kMaxKeys = 512;
    static constexpr int kMaxMouseButtons = 8;

    std::array<unsigned char, kMaxKeys> m_currentKeys{};
    std::array<unsigned char, kMaxKeys> m_previousKeys{};

    std::array<unsigned char, kMaxMouseButtons> m_currentMouse{};
    std::array<unsigned char, kMaxMouseButtons> m_previousMouse{};

    glm::vec2 m_mousePosition{0.0F, 0.0F};
    glm::vec2 m_mouseDelta{0.0F, 0.0F};
    float m_scrollDelta = 0.0F;
    bool m_firstMouseSample = true;
};
} // namespace vista::platform
