#include "vista/render/SceneRenderer.hpp"

#include <iostream>

#include "vista/animation/AnimationEvaluator.hpp"
#include "vista/math/Transform.hpp"

namespace vista::render
{
namespace
{
const glm::vec3 kOrigin{0.0F, 0.0F, 0.0F};
const glm::vec3 kWorldUp{0.0F, 1.0F, 0.0F};
const glm::vec3 kNoEmission{0.0F, 0.0F, 0.0F};

/// Returns the renderer to Ready when a frame ends, however it ends.
class FrameScope
{
public:
    explicit FrameScope(RendererState& state)
        : m_state(state)
    {
        m_state = RendererState::Rendering;
    }
    ~FrameScope()
    {
        m_state = RendererState::Ready;
    }

    FrameScope(const FrameScope&) = delete;
    FrameScope& operator=(const FrameScope&) = delete;

private:
    RendererState& m_state;
};
} // namespace

const char* RendererStateToString(RendererState state)
{
    switch (state)
    {
        case RendererState::Uninitialized: return "uninitialized";
        case RendererState::Initializing: return "initializing";
        case RendererState::Ready: return "ready";
        case RendererState::Rendering: return "rendering";
        case RendererState::Failed: return "failed";
        case RendererState::Disposed: return "disposed";
    }
    return "unknown";
}

SceneRenderer::SceneRenderer(IGraphicsDevice& device)
    : m_device(device)
    , m_programs(device)
{
}

SceneRenderer::~SceneRenderer()
{
    Dispose();
}

bool SceneRenderer::Initialize(const IRenderSurface& surface, std::string* outError)
{
    if (m_state == RendererState::Ready)
    {
        return true;
    }
    if (m_state != RendererState::Uninitialized)
    {
        if (outError != nullptr)
        {
            *outError = m_state == RendererState::Failed
                ? m_lastError
                : std::string{"Renderer cannot initialize from state '"} + RendererStateToString(m_state) + "'.";
        }
        return false;
    }

    m_state = RendererState::Initializing;

    const DrawableSize drawable = ComputeDrawableSize(surface);
    if (drawable.width <= 0 || drawable.height <= 0)
    {
        Fail("Drawable surface has no pixels.", outError);
        return false;
    }

    if (!m_device.HasContext())
    {
        Fail("No graphics context available.", outError);
        return false;
    }

    m_device.ConfigureDefaultState();

    if (!m_programs.BuildStandardProgram().has_value())
    {
        Fail("Standard shader program failed to build.", outError);
        return false;
    }

    m_surface = &surface;
    m_viewport = DrawableSize{};
    UpdateViewport();
    m_fpsCounter.Reset();
    m_stats = core::PerformanceStats{};
    m_lastError.clear();
    m_state = RendererState::Ready;
    std::cout << "[Renderer] Ready (" << m_viewport.width << "x" << m_viewport.height << ").\n";
    return true;
}

void SceneRenderer::Fail(const std::string& error, std::string* outError)
{
    m_lastError = error;
    m_state = RendererState::Failed;
    m_programs.Release();
    std::cerr << "[Renderer] Initialization failed: " << error << "\n";
    if (outError != nullptr)
    {
        *outError = error;
    }
}

void SceneRenderer::UpdateViewport()
{
    if (m_surface == nullptr)
    {
        return;
    }
    const DrawableSize drawable = ComputeDrawableSize(*m_surface);
    if (drawable.width == m_viewport.width && drawable.height == m_viewport.height)
    {
        return;
    }
    m_viewport = drawable;
    m_device.SetViewport(drawable.width, drawable.height);
}

void SceneRenderer::Render(const scene::Scene& scene, const scene::Camera& camera, double timeMs)
{
    // Also rejects re-entrant calls, which arrive while the state is Rendering.
    if (m_state != RendererState::Ready)
    {
        return;
    }
    FrameScope frame(m_state);

    UpdateViewport();
    m_device.Clear(scene.ambientColor);
    m_fpsCounter.AddFrame(timeMs);

    const std::optional<ProgramHandle> program = m_programs.StandardProgram();
    if (!program.has_value())
    {
        return;
    }

    m_device.UseProgram(*program);

    const float aspect = m_viewport.height > 0
        ? static_cast<float>(m_viewport.width) / static_cast<float>(m_viewport.height)
        : 1.0F;
    m_device.SetUniform(*program, "projectionMatrix", UniformValue::Mat4(math::Perspective(camera.fov, aspect, kNearPlane, kFarPlane)));
    m_device.SetUniform(*program, "viewMatrix", UniformValue::Mat4(math::LookAt(camera.position, kOrigin, kWorldUp)));
    m_device.SetUniform(*program, "lightDirection", UniformValue::Vec3(scene.directionalLight.direction));
    m_device.SetUniform(*program, "lightColor", UniformValue::Vec3(scene.directionalLight.color));
    m_device.SetUniform(*program, "ambientColor", UniformValue::Vec3(scene.ambientColor));
    m_device.SetUniform(*program, "cameraPosition", UniformValue::Vec3(camera.position));
    m_device.SetUniform(*program, "time", UniformValue::Float(static_cast<float>(timeMs)));

    core::PerformanceStats frameStats;
    for (const scene::SceneObject& object : scene.objects)
    {
        const math::Transform effective = animation::Evaluate(object.transform, object.animation, timeMs);

        m_device.SetUniform(*program, "modelMatrix", UniformValue::Mat4(math::ComposeModelMatrix(effective)));
        m_device.SetUniform(*program, "normalMatrix", UniformValue::Mat4(math::NormalMatrix(effective)));
        m_device.SetUniform(*program, "color", UniformValue::Vec3(object.material.color));
        m_device.SetUniform(*program, "emissionColor", UniformValue::Vec3(object.material.emission.value_or(kNoEmission)));
        m_device.SetUniform(*program, "metallic", UniformValue::Float(object.material.metallic));
        m_device.SetUniform(*program, "roughness", UniformValue::Float(object.material.roughness));

        const assets::MeshData& mesh = m_geometry.Get(object.geometry);
        const GpuMeshId gpuMesh = AcquireGpuMesh(mesh);
        if (gpuMesh == kInvalidGpuMesh)
        {
            continue;
        }

        m_device.DrawMesh(gpuMesh);
        frameStats.triangleCount += mesh.triangleCount;
        frameStats.drawCallCount += 1;
    }

    frameStats.fps = m_fpsCounter.Fps();
    m_stats = frameStats;
}

GpuMeshId SceneRenderer::AcquireGpuMesh(const assets::MeshData& mesh)
{
    const auto existing = m_gpuMeshes.find(&mesh);
    if (existing != m_gpuMeshes.end())
    {
        return existing->second;
    }

    const GpuMeshId id = m_device.UploadMesh(mesh);
    if (id == kInvalidGpuMesh)
    {
        std::cerr << "[Renderer] Mesh upload failed; objects using it are skipped.\n";
    }
    // Failed uploads are remembered too, so they are reported once.
    m_gpuMeshes.emplace(&mesh, id);
    return id;
}

bool SceneRenderer::ReloadProgram()
{
    if (m_state != RendererState::Ready)
    {
        return false;
    }
    if (!m_programs.BuildStandardProgram().has_value())
    {
        std::cerr << "[Renderer] Program reload failed; frames are skipped until the next successful reload.\n";
        return false;
    }
    return true;
}

void SceneRenderer::ReleaseGpuMeshes()
{
    for (const auto& [mesh, id] : m_gpuMeshes)
    {
        (void)mesh;
        m_device.FreeMesh(id);
    }
    m_gpuMeshes.clear();
}

void SceneRenderer::Dispose()
{
    if (m_state == RendererState::Disposed)
    {
        return;
    }
    ReleaseGpuMeshes();
    m_programs.Release();
    m_geometry.Clear();
    m_surface = nullptr;
    m_state = RendererState::Disposed;
}
} // namespace vista::render
