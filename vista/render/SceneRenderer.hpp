#pragma once

#include <string>
#include <unordered_map>

#include "vista/assets/GeometryCache.hpp"
#include "vista/core/FrameStats.hpp"
#include "vista/render/GraphicsDevice.hpp"
#include "vista/render/RenderSurface.hpp"
#include "vista/render/ShaderProgramManager.hpp"
#include "vista/scene/Scene.hpp"

namespace vista::render
{
enum class RendererState
{
    Uninitialized,
    Initializing,
    Ready,
    Rendering,
    Failed,
    Disposed
};

[[nodiscard]] const char* RendererStateToString(RendererState state);

constexpr float kNearPlane = 0.1F;
constexpr float kFarPlane = 1000.0F;

/// Draws a Scene with the standard program. The graphics device is injected and
/// must outlive the renderer, as must the surface passed to Initialize().
///
/// Render() never throws and never fails the frame for a single object: bad
/// geometry becomes a unit box, unknown animations are ignored and a missing
/// program skips the frame.
class SceneRenderer
{
public:
    explicit SceneRenderer(IGraphicsDevice& device);
    ~SceneRenderer();

    SceneRenderer(const SceneRenderer&) = delete;
    SceneRenderer& operator=(const SceneRenderer&) = delete;

    /// Uninitialized -> Initializing -> Ready, or Failed when the surface has no
    /// pixels, the device has no context or the standard program cannot be built.
    /// A failed renderer stays failed; later calls return false without retrying.
    bool Initialize(const IRenderSurface& surface, std::string* outError = nullptr);

    void Render(const scene::Scene& scene, const scene::Camera& camera, double timeMs);

    /// Rebuilds the standard program. While it is absent frames are cleared but
    /// not drawn, and the last published stats are kept.
    bool ReloadProgram();

    /// Releases GPU meshes, the program and the mesh cache. Idempotent.
    void Dispose();

    [[nodiscard]] RendererState State() const { return m_state; }
    [[nodiscard]] bool IsReady() const { return m_state == RendererState::Ready; }
    [[nodiscard]] bool HasProgram() const { return m_programs.StandardProgram().has_value(); }
    [[nodiscard]] const core::PerformanceStats& Stats() const { return m_stats; }
    [[nodiscard]] const std::string& LastError() const { return m_lastError; }
    [[nodiscard]] const assets::GeometryCache& Geometry() const { return m_geometry; }
    [[nodiscard]] DrawableSize ViewportSize() const { return m_viewport; }

private:
    void Fail(const std::string& error, std::string* outError);
    void UpdateViewport();
    GpuMeshId AcquireGpuMesh(const assets::MeshData& mesh);
    void ReleaseGpuMeshes();

    IGraphicsDevice& m_device;
    const IRenderSurface* m_surface = nullptr;
    ShaderProgramManager m_programs;
    assets::GeometryCache m_geometry;
    // Keyed by cache entry address; entries are stable until the cache is cleared.
    std::unordered_map<const assets::MeshData*, GpuMeshId> m_gpuMeshes;

    RendererState m_state = RendererState::Uninitialized;
    std::string m_lastError;
    DrawableSize m_viewport{};
    core::FpsCounter m_fpsCounter;
    core::PerformanceStats m_stats{};
};
} // namespace vista::render
