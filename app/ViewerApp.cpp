#include "app/ViewerApp.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

#include <GLFW/glfw3.h>

#include "vista/scene/SceneSerialization.hpp"

namespace vista::app
{
namespace
{
// GLFW reports wheel lines; camera zoom expects pixel-style deltas.
constexpr float kScrollLinesToPixels = 100.0F;
constexpr std::size_t kMaxSceneHotkeys = 9;
} // namespace

ViewerApp::ViewerApp()
    : m_renderer(m_device)
    , m_loop(m_renderer, m_camera)
{
}

ViewerApp::~ViewerApp()
{
    Shutdown();
}

bool ViewerApp::Run(const std::filesystem::path& configPath)
{
    if (!Initialize(configPath))
    {
        Shutdown();
        return false;
    }

    bool ok = true;
    double previousFrameMs = m_window.TimeMs();
    while (!m_window.ShouldClose())
    {
        const double frameStartMs = m_window.TimeMs();
        const double deltaMs = frameStartMs - previousFrameMs;
        previousFrameMs = frameStartMs;

        m_window.PollEvents();
        m_input.Update(m_window);
        HandleInput(deltaMs);

        if (!m_loop.Tick(m_window.TimeMs()))
        {
            if (m_renderer.State() == render::RendererState::Failed)
            {
                std::cerr << "[Viewer] Renderer failed: " << m_renderer.LastError() << "\n";
                ok = false;
            }
            break;
        }

        m_window.SwapBuffers();
        LimitFrameRate(frameStartMs);
    }

    Shutdown();
    return ok;
}

bool ViewerApp::Initialize(const std::filesystem::path& configPath)
{
    std::string configStatus;
    if (!core::LoadViewerConfig(configPath, &m_config, &configStatus))
    {
        std::cerr << "[Viewer] " << configStatus << " Using defaults.\n";
        m_config = core::ViewerConfig{};
    }
    else
    {
        std::cout << "[Viewer] " << configStatus << "\n";
    }

    platform::WindowSettings settings;
    settings.width = m_config.width;
    settings.height = m_config.height;
    settings.vsync = m_config.vsync;
    if (!m_window.Initialize(settings))
    {
        return false;
    }
    m_initialized = true;

    if (!m_device.LoadFunctions(glfwGetProcAddress))
    {
        std::cerr << "[Viewer] Failed to load OpenGL functions.\n";
        return false;
    }

    if (!LoadScenes())
    {
        return false;
    }

    std::string error;
    if (!m_renderer.Initialize(m_window, &error))
    {
        std::cerr << "[Viewer] Renderer initialization failed: " << error << "\n";
        return false;
    }

    ResetCamera();
    m_loop.SetStatsCallback([this](const core::PerformanceStats& stats) { OnStats(stats); });
    m_loop.SetScene(m_scenes[m_currentScene].scene);
    if (!m_loop.Start(m_window.TimeMs()))
    {
        std::cerr << "[Viewer] Render loop could not start.\n";
        return false;
    }

    std::cout << "[Viewer] Controls: drag rotate, shift+drag pan, wheel zoom, WASD/QE move, 1-9 scenes, "
                 "R reload scene, F5 reload shaders, Home reset camera, F11 fullscreen, Esc quit.\n";
    return true;
}

void ViewerApp::Shutdown()
{
    if (!m_initialized)
    {
        return;
    }
    m_initialized = false;

    m_loop.Stop();
    m_renderer.Dispose();
    m_device.FreeAllMeshes();
    m_window.Shutdown();
}

bool ViewerApp::LoadScenes()
{
    m_scenes.clear();
    for (const std::filesystem::path& path : scene::ListSceneFiles(m_config.sceneDirectory))
    {
        auto loaded = std::make_shared<scene::Scene>();
        std::string error;
        if (!scene::LoadSceneFile(path, loaded.get(), &error))
        {
            std::cerr << "[Viewer] Skipping scene " << path.string() << ": " << error << "\n";
            continue;
        }
        m_scenes.push_back(SceneEntry{path, std::move(loaded)});
    }

    if (m_scenes.empty())
    {
        std::cerr << "[Viewer] No scenes found in " << m_config.sceneDirectory << "\n";
        return false;
    }

    m_currentScene = 0;
    for (std::size_t i = 0; i < m_scenes.size(); ++i)
    {
        if (m_scenes[i].scene->id == m_config.initialScene)
        {
            m_currentScene = i;
            break;
        }
    }

    std::cout << "[Viewer] Loaded " << m_scenes.size() << " scene(s).\n";
    for (std::size_t i = 0; i < m_scenes.size(); ++i)
    {
        std::cout << "  [" << (i + 1) << "] " << m_scenes[i].scene->name << " (" << m_scenes[i].scene->objects.size()
                  << " objects)\n";
    }
    return true;
}

void ViewerApp::SelectScene(std::size_t index)
{
    if (index >= m_scenes.size() || index == m_currentScene)
    {
        return;
    }
    m_currentScene = index;
    m_loop.SetScene(m_scenes[index].scene);
    m_window.SetTitle("Vista - " + m_scenes[index].scene->name);
    std::cout << "[Viewer] Scene: " << m_scenes[index].scene->name << "\n";
}

void ViewerApp::ReloadCurrentScene()
{
    SceneEntry& entry = m_scenes[m_currentScene];
    auto reloaded = std::make_shared<scene::Scene>();
    std::string error;
    if (!scene::LoadSceneFile(entry.path, reloaded.get(), &error))
    {
        std::cerr << "[Viewer] Reload failed, keeping previous scene: " << error << "\n";
        return;
    }
    entry.scene = std::move(reloaded);
    m_loop.SetScene(entry.scene);
    std::cout << "[Viewer] Reloaded " << entry.path.string() << "\n";
}

void ViewerApp::ResetCamera()
{
    m_camera = scene::Camera{};
    m_camera.fov = m_config.cameraFov;
    m_cameraController.Reset();
}

void ViewerApp::HandleInput(double deltaMs)
{
    if (m_input.IsKeyPressed(GLFW_KEY_ESCAPE))
    {
        m_window.SetShouldClose(true);
    }
    if (m_input.IsKeyPressed(GLFW_KEY_F11))
    {
        m_window.ToggleFullscreen();
    }
    if (m_input.IsKeyPressed(GLFW_KEY_HOME))
    {
        ResetCamera();
    }
    if (m_input.IsKeyPressed(GLFW_KEY_R))
    {
        ReloadCurrentScene();
    }
    if (m_input.IsKeyPressed(GLFW_KEY_F5))
    {
        if (!m_renderer.ReloadProgram())
        {
            std::cerr << "[Viewer] Shader reload failed; frames are skipped until the next successful reload.\n";
        }
    }
    for (std::size_t i = 0; i < kMaxSceneHotkeys; ++i)
    {
        if (m_input.IsKeyPressed(GLFW_KEY_1 + static_cast<int>(i)))
        {
            SelectScene(i);
        }
    }

    platform::CameraInputState state;
    state.dragging = m_input.IsMouseDown(GLFW_MOUSE_BUTTON_LEFT) && !m_input.IsMousePressed(GLFW_MOUSE_BUTTON_LEFT);
    state.panModifier = m_input.IsKeyDown(GLFW_KEY_LEFT_SHIFT) || m_input.IsKeyDown(GLFW_KEY_RIGHT_SHIFT);
    state.mouseDelta = m_input.MouseDelta();
    state.wheelDelta = -m_input.ScrollDelta() * kScrollLinesToPixels;
    state.moveForward = m_input.IsKeyDown(GLFW_KEY_W) || m_input.IsKeyDown(GLFW_KEY_UP);
    state.moveBack = m_input.IsKeyDown(GLFW_KEY_S) || m_input.IsKeyDown(GLFW_KEY_DOWN);
    state.moveLeft = m_input.IsKeyDown(GLFW_KEY_A) || m_input.IsKeyDown(GLFW_KEY_LEFT);
    state.moveRight = m_input.IsKeyDown(GLFW_KEY_D) || m_input.IsKeyDown(GLFW_KEY_RIGHT);
    state.moveUp = m_input.IsKeyDown(GLFW_KEY_Q);
    state.moveDown = m_input.IsKeyDown(GLFW_KEY_E);
    m_cameraController.Update(m_camera, state, deltaMs);
}

void ViewerApp::OnStats(const core::PerformanceStats& stats)
{
    const double nowMs = m_loop.ElapsedMs();
    if (nowMs - m_lastStatsLogMs < m_config.statsIntervalSeconds * 1000.0)
    {
        return;
    }
    m_lastStatsLogMs = nowMs;

    std::ostringstream title;
    title << "Vista - " << m_scenes[m_currentScene].scene->name << " | " << stats.fps << " FPS | " << stats.triangleCount
          << " tris | " << stats.drawCallCount << " draws";
    m_window.SetTitle(title.str());
    std::cout << "[Viewer] fps=" << stats.fps << " triangles=" << stats.triangleCount << " drawCalls=" << stats.drawCallCount
              << "\n";
}

void ViewerApp::LimitFrameRate(double frameStartMs) const
{
    if (m_config.vsync || m_config.fpsLimit <= 0)
    {
        return;
    }

    const double targetMs = 1000.0 / static_cast<double>(m_config.fpsLimit);
    double elapsedMs = m_window.TimeMs() - frameStartMs;
    if (elapsedMs >= targetMs)
    {
        return;
    }

    const double sleepThresholdMs = 2.0;
    const double remainingMs = targetMs - elapsedMs;
    if (remainingMs > sleepThresholdMs)
    {
        std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(remainingMs - sleepThresholdMs));
    }
    while ((elapsedMs = m_window.TimeMs() - frameStartMs) < targetMs)
    {
    }
}
} // namespace vista::app
