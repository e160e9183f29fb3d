#include "vista/core/RenderLoop.hpp"

#include <iostream>

#include "vista/render/SceneRenderer.hpp"

namespace vista::core
{
RenderLoop::RenderLoop(render::SceneRenderer& renderer, const scene::Camera& camera)
    : m_renderer(renderer)
    , m_camera(camera)
{
}

RenderLoop::~RenderLoop()
{
    Stop();
}

void RenderLoop::SetScene(std::shared_ptr<const scene::Scene> scene)
{
    m_pendingScene = std::move(scene);
    m_hasPendingScene = true;
}

bool RenderLoop::Start(double nowMs)
{
    if (m_running)
    {
        return true;
    }
    if (!m_renderer.IsReady())
    {
        std::cerr << "[RenderLoop] Renderer is " << render::RendererStateToString(m_renderer.State()) << "; loop not started.\n";
        return false;
    }

    m_running = true;
    m_startMs = nowMs;
    m_elapsedMs = 0.0;
    m_frameIndex = 0;
    return true;
}

void RenderLoop::Stop()
{
    m_running = false;
}

bool RenderLoop::Tick(double nowMs)
{
    if (!m_running || m_inTick)
    {
        return false;
    }
    if (!m_renderer.IsReady())
    {
        std::cerr << "[RenderLoop] Renderer left the ready state; stopping.\n";
        Stop();
        return false;
    }

    m_inTick = true;
    if (m_hasPendingScene)
    {
        m_scene = std::move(m_pendingScene);
        m_pendingScene.reset();
        m_hasPendingScene = false;
    }

    m_elapsedMs = nowMs - m_startMs;
    if (m_scene != nullptr)
    {
        m_renderer.Render(*m_scene, m_camera, m_elapsedMs);
    }
    ++m_frameIndex;
    m_inTick = false;

    if (m_statsCallback)
    {
        m_statsCallback(m_renderer.Stats());
    }
    return true;
}
} // namespace vista::core
