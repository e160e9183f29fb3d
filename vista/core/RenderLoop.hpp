#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "vista/core/FrameStats.hpp"
#include "vista/scene/Scene.hpp"

namespace vista::render
{
class SceneRenderer;
}

namespace vista::core
{
/// Drives one SceneRenderer::Render per Tick. The camera is owned by the host
/// and read each frame; scenes are swapped between frames.
///
/// After Stop() (or destruction) no tick reaches the renderer, so the loop can
/// be stopped before the renderer is disposed without leaving a pending frame.
class RenderLoop
{
public:
    using StatsCallback = std::function<void(const PerformanceStats&)>;

    RenderLoop(render::SceneRenderer& renderer, const scene::Camera& camera);
    ~RenderLoop();

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    /// Takes effect at the start of the next tick, never mid-frame.
    void SetScene(std::shared_ptr<const scene::Scene> scene);
    [[nodiscard]] std::shared_ptr<const scene::Scene> CurrentScene() const { return m_scene; }

    /// Starts scheduling; |nowMs| becomes time zero for animation. Fails when
    /// the renderer is not Ready.
    bool Start(double nowMs);
    void Stop();

    /// Renders one frame. Returns false when stopped, re-entered, or the
    /// renderer left the Ready state (which also stops the loop).
    bool Tick(double nowMs);

    /// Called after every rendered frame with the renderer's stats.
    void SetStatsCallback(StatsCallback callback) { m_statsCallback = std::move(callback); }

    [[nodiscard]] bool IsRunning() const { return m_running; }
    [[nodiscard]] std::uint64_t FrameIndex() const { return m_frameIndex; }
    [[nodiscard]] double ElapsedMs() const { return m_elapsedMs; }

private:
    render::SceneRenderer& m_renderer;
    const scene::Camera& m_camera;
    std::shared_ptr<const scene::Scene> m_scene;
    std::shared_ptr<const scene::Scene> m_pendingScene;
    bool m_hasPendingScene = false;
    StatsCallback m_statsCallback;

    bool m_running = false;
    bool m_inTick = false;
    double m_startMs = 0.0;
    double m_elapsedMs = 0.0;
    std::uint64_t m_frameIndex = 0;
};
} // namespace vista::core
