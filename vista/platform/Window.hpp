#pragma once

#include <string>

#include "vista/render/RenderSurface.hpp"

struct GLFWwindow;

namespace vista::platform
{
struct WindowSettings
{
    int width = 1280;
    int height = 720;
    bool vsync = true;
    std::string title = "Vista";
};

/// GLFW window with a current GL 4.5 core context. Exposes its client area as
/// the renderer's drawable surface: logical size in screen coordinates and the
/// framebuffer/window ratio as device pixel ratio.
class Window final : public render::IRenderSurface
{
public:
    Window() = default;
    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const WindowSettings& settings);
    void Shutdown();

    void PollEvents() const;
    void SwapBuffers() const;

    [[nodiscard]] bool ShouldClose() const;
    void SetShouldClose(bool shouldClose) const;
    void SetTitle(const std::string& title) const;
    void SetVSync(bool enabled) const;
    void ToggleFullscreen();

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }
    [[nodiscard]] double TimeMs() const;

    [[nodiscard]] int LogicalWidth() const override { return m_windowWidth; }
    [[nodiscard]] int LogicalHeight() const override { return m_windowHeight; }
    [[nodiscard]] float DevicePixelRatio() const override;

    /// Vertical scroll accumulated since the last call, in GLFW lines.
    float ConsumeScrollDelta();

private:
    static void FramebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void WindowResizeCallback(GLFWwindow* window, int width, int height);
    static void ScrollCallback(GLFWwindow* window, double xOffset, double yOffset);

    GLFWwindow* m_window = nullptr;

    int m_windowedX = 100;
    int m_windowedY = 100;
    int m_windowedWidth = 1280;
    int m_windowedHeight = 720;

    int m_windowWidth = 1280;
    int m_windowHeight = 720;
    int m_fbWidth = 1280;
    int m_fbHeight = 720;
    float m_scrollDelta = 0.0F;

    bool m_fullscreen = false;
};
} // namespace vista::platform
