#include "vista/platform/Window.hpp"

#include <iostream>

#include <GLFW/glfw3.h>

namespace vista::platform
{
Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const WindowSettings& settings)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "[Viewer] Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_windowWidth = settings.width;
    m_windowHeight = settings.height;
    m_windowedWidth = settings.width;
    m_windowedHeight = settings.height;

    m_window = glfwCreateWindow(m_windowWidth, m_windowHeight, settings.title.c_str(), nullptr, nullptr);
    if (m_window == nullptr)
    {
        std::cerr << "[Viewer] Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferResizeCallback);
    glfwSetWindowSizeCallback(m_window, WindowResizeCallback);
    glfwSetScrollCallback(m_window, ScrollCallback);
    glfwGetWindowSize(m_window, &m_windowWidth, &m_windowHeight);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);

    SetVSync(settings.vsync);
    return true;
}

void Window::Shutdown()
{
    if (m_window != nullptr)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
    }
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

void Window::SetShouldClose(bool shouldClose) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowShouldClose(m_window, shouldClose ? GLFW_TRUE : GLFW_FALSE);
    }
}

void Window::SetTitle(const std::string& title) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowTitle(m_window, title.c_str());
    }
}

void Window::SetVSync(bool enabled) const
{
    glfwSwapInterval(enabled ? 1 : 0);
}

void Window::ToggleFullscreen()
{
    if (m_window == nullptr)
    {
        return;
    }

    if (m_fullscreen)
    {
        glfwSetWindowMonitor(m_window, nullptr, m_windowedX, m_windowedY, m_windowedWidth, m_windowedHeight, 0);
        m_fullscreen = false;
        return;
    }

    GLFWmonitor* primaryMonitor = glfwGetPrimaryMonitor();
    const GLFWvidmode* primaryMode = glfwGetVideoMode(primaryMonitor);
    if (primaryMode == nullptr)
    {
        return;
    }

    glfwGetWindowPos(m_window, &m_windowedX, &m_windowedY);
    glfwGetWindowSize(m_window, &m_windowedWidth, &m_windowedHeight);
    glfwSetWindowMonitor(m_window, primaryMonitor, 0, 0, primaryMode->width, primaryMode->height, primaryMode->refreshRate);
    m_fullscreen = true;
}

double Window::TimeMs() const
{
    return glfwGetTime() * 1000.0;
}

float Window::DevicePixelRatio() const
{
    if (m_windowWidth <= 0)
    {
        return 1.0F;
    }
    return static_cast<float>(m_fbWidth) / static_cast<float>(m_windowWidth);
}

float Window::ConsumeScrollDelta()
{
    const float delta = m_scrollDelta;
    m_scrollDelta = 0.0F;
    return delta;
}

void Window::FramebufferResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
    {
        return;
    }

    self->m_fbWidth = width;
    self->m_fbHeight = height;
}

void Window::WindowResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
    {
        return;
    }

    self->m_windowWidth = width;
    self->m_windowHeight = height;
}

void Window::ScrollCallback(GLFWwindow* window, double xOffset, double yOffset)
{
    (void)xOffset;
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self != nullptr)
    {
        self->m_scrollDelta += static_cast<float>(yOffset);
    }
}
} // namespace vista::platform
