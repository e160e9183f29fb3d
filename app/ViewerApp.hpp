#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "vista/core/RenderLoop.hpp"
#include "vista/core/ViewerConfig.hpp"
#include "vista/platform/CameraController.hpp"
#include "vista/platform/Input.hpp"
#include "vista/platform/Window.hpp"
#include "vista/render/GlGraphicsDevice.hpp"
#include "vista/render/SceneRenderer.hpp"
#include "vista/scene/Scene.hpp"

namespace vista::app
{
/// Desktop host: owns the window, the GL device, the renderer and the frame
/// loop, and feeds camera input and scene selection into them.
class ViewerApp
{
public:
    ViewerApp();
    ~ViewerApp();

    ViewerApp(const ViewerApp&) = delete;
    ViewerApp& operator=(const ViewerApp&) = delete;

    bool Run(const std::filesystem::path& configPath);

private:
    struct SceneEntry
    {
        std::filesystem::path path;
        std::shared_ptr<const scene::Scene> scene;
    };

    bool Initialize(const std::filesystem::path& configPath);
    void Shutdown();

    bool LoadScenes();
    void SelectScene(std::size_t index);
    void ReloadCurrentScene();
    void ResetCamera();

    void HandleInput(double deltaMs);
    void OnStats(const core::PerformanceStats& stats);
    void LimitFrameRate(double frameStartMs) const;

    core::ViewerConfig m_config;
    platform::Window m_window;
    platform::Input m_input;
    render::GlGraphicsDevice m_device;
    render::SceneRenderer m_renderer;

    scene::Camera m_camera;
    platform::CameraController m_cameraController;
    core::RenderLoop m_loop;

    std::vector<SceneEntry> m_scenes;
    std::size_t m_currentScene = 0;

    double m_lastStatsLogMs = 0.0;
    bool m_initialized = false;
};
} // namespace vista::app
