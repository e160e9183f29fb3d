#pragma once

#include <cstdint>
#include <string>

#include <glm/vec3.hpp>

#include "vista/render/Uniforms.hpp"

namespace vista::assets
{
struct MeshData;
}

namespace vista::render
{
using ProgramHandle = std::uint32_t;
using GpuMeshId = std::uint32_t;

constexpr ProgramHandle kInvalidProgram = 0;
constexpr GpuMeshId kInvalidGpuMesh = 0;

/// GPU operations the scene renderer needs. The OpenGL implementation lives in
/// GlGraphicsDevice; tests inject a recording fake.
class IGraphicsDevice
{
public:
    virtual ~IGraphicsDevice() = default;

    [[nodiscard]] virtual bool HasContext() const = 0;

    /// Depth test and back-face culling.
    virtual void ConfigureDefaultState() = 0;
    virtual void SetViewport(int width, int height) = 0;
    virtual void Clear(const glm::vec3& color) = 0;

    /// Returns kInvalidProgram on compile or link failure; never throws.
    virtual ProgramHandle CreateProgram(const char* vertexSource, const char* fragmentSource) = 0;
    virtual void DeleteProgram(ProgramHandle program) = 0;
    virtual void UseProgram(ProgramHandle program) = 0;
    virtual void SetUniform(ProgramHandle program, const std::string& name, const UniformValue& value) = 0;

    virtual GpuMeshId UploadMesh(const assets::MeshData& mesh) = 0;
    virtual void DrawMesh(GpuMeshId mesh) = 0;
    virtual void FreeMesh(GpuMeshId mesh) = 0;
};
} // namespace vista::render
