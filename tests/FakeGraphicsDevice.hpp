#pragma once

#include <map>
#include <string>
#include <vector>

#include "vista/assets/GeometryCache.hpp"
#include "vista/render/GraphicsDevice.hpp"
#include "vista/render/RenderSurface.hpp"

namespace vista::test
{
/// Records every device call; uniforms are snapshotted at each draw.
class FakeGraphicsDevice final : public render::IGraphicsDevice
{
public:
    struct DrawRecord
    {
        render::GpuMeshId mesh = render::kInvalidGpuMesh;
        std::map<std::string, render::UniformValue> uniforms;
    };

    bool hasContext = true;
    bool failProgramLink = false;
    bool failUpload = false;

    int configureCalls = 0;
    std::vector<std::pair<int, int>> viewports;
    std::vector<glm::vec3> clears;
    int programsCreated = 0;
    std::vector<render::ProgramHandle> deletedPrograms;
    render::ProgramHandle usedProgram = render::kInvalidProgram;
    std::map<std::string, render::UniformValue> currentUniforms;
    std::vector<std::uint32_t> uploadedVertexCounts;
    std::vector<DrawRecord> draws;
    std::vector<render::GpuMeshId> freedMeshes;

    [[nodiscard]] bool HasContext() const override { return hasContext; }
    void ConfigureDefaultState() override { ++configureCalls; }
    void SetViewport(int width, int height) override { viewports.emplace_back(width, height); }
    void Clear(const glm::vec3& color) override { clears.push_back(color); }

    render::ProgramHandle CreateProgram(const char* vertexSource, const char* fragmentSource) override
    {
        if (failProgramLink || vertexSource == nullptr || fragmentSource == nullptr)
        {
            return render::kInvalidProgram;
        }
        ++programsCreated;
        return m_nextProgram++;
    }

    void DeleteProgram(render::ProgramHandle program) override { deletedPrograms.push_back(program); }
    void UseProgram(render::ProgramHandle program) override { usedProgram = program; }

    void SetUniform(render::ProgramHandle program, const std::string& name, const render::UniformValue& value) override
    {
        (void)program;
        currentUniforms.insert_or_assign(name, value);
    }

    render::GpuMeshId UploadMesh(const assets::MeshData& mesh) override
    {
        if (failUpload)
        {
            return render::kInvalidGpuMesh;
        }
        uploadedVertexCounts.push_back(static_cast<std::uint32_t>(mesh.positions.size()));
        return m_nextMesh++;
    }

    void DrawMesh(render::GpuMeshId mesh) override { draws.push_back(DrawRecord{mesh, currentUniforms}); }
    void FreeMesh(render::GpuMeshId mesh) override { freedMeshes.push_back(mesh); }

private:
    render::ProgramHandle m_nextProgram = 1;
    render::GpuMeshId m_nextMesh = 1;
};

class FakeSurface final : public render::IRenderSurface
{
public:
    FakeSurface(int width, int height, float ratio = 1.0F)
        : width(width)
        , height(height)
        , ratio(ratio)
    {
    }

    [[nodiscard]] int LogicalWidth() const override { return width; }
    [[nodiscard]] int LogicalHeight() const override { return height; }
    [[nodiscard]] float DevicePixelRatio() const override { return ratio; }

    int width;
    int height;
    float ratio;
};
} // namespace vista::test
