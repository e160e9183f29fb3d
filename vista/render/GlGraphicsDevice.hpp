#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "vista/render/GraphicsDevice.hpp"

namespace vista::render
{
using GlProc = void (*)();
using GlProcLoader = GlProc (*)(const char* name);

/// OpenGL 4.5 core implementation. Requires a current context on the calling
/// thread; LoadFunctions() must succeed before any other call does work.
class GlGraphicsDevice final : public IGraphicsDevice
{
public:
    GlGraphicsDevice() = default;
    ~GlGraphicsDevice() override;

    GlGraphicsDevice(const GlGraphicsDevice&) = delete;
    GlGraphicsDevice& operator=(const GlGraphicsDevice&) = delete;

    bool LoadFunctions(GlProcLoader loader);

    [[nodiscard]] bool HasContext() const override { return m_loaded; }

    void ConfigureDefaultState() override;
    void SetViewport(int width, int height) override;
    void Clear(const glm::vec3& color) override;

    ProgramHandle CreateProgram(const char* vertexSource, const char* fragmentSource) override;
    void DeleteProgram(ProgramHandle program) override;
    void UseProgram(ProgramHandle program) override;
    void SetUniform(ProgramHandle program, const std::string& name, const UniformValue& value) override;

    GpuMeshId UploadMesh(const assets::MeshData& mesh) override;
    void DrawMesh(GpuMeshId mesh) override;
    void FreeMesh(GpuMeshId mesh) override;

    void FreeAllMeshes();

private:
    struct GpuMeshInfo
    {
        unsigned int vao = 0;
        unsigned int positionVbo = 0;
        unsigned int normalVbo = 0;
        unsigned int uvVbo = 0;
        unsigned int ebo = 0;
        std::uint32_t indexCount = 0;
    };

    static unsigned int CompileShader(unsigned int type, const char* source);
    static void DeleteMeshBuffers(GpuMeshInfo& info);
    int UniformLocation(ProgramHandle program, const std::string& name);

    bool m_loaded = false;
    std::unordered_map<GpuMeshId, GpuMeshInfo> m_meshes;
    GpuMeshId m_nextMeshId = 1;
    std::unordered_map<ProgramHandle, std::unordered_map<std::string, int>> m_uniformLocations;
};
} // namespace vista::render
