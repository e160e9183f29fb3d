#include "vista/render/GlGraphicsDevice.hpp"

#include <iostream>
#include <string>
#include <vector>

#include <glad/glad.h>

#include <glm/gtc/type_ptr.hpp>

#include "vista/assets/GeometryCache.hpp"

namespace vista::render
{
namespace
{
unsigned int UploadArrayBuffer(GLuint attribute, GLint components, const float* data, std::size_t floatCount)
{
    unsigned int vbo = 0;
    glGenBuffers(1, &vbo);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(floatCount * sizeof(float)), data, GL_STATIC_DRAW);
    glVertexAttribPointer(attribute, components, GL_FLOAT, GL_FALSE, 0, nullptr);
    glEnableVertexAttribArray(attribute);
    return vbo;
}
} // namespace

GlGraphicsDevice::~GlGraphicsDevice()
{
    FreeAllMeshes();
}

bool GlGraphicsDevice::LoadFunctions(GlProcLoader loader)
{
    m_loaded = loader != nullptr && gladLoadGL(reinterpret_cast<GLADloadfunc>(loader)) != 0;
    if (!m_loaded)
    {
        std::cerr << "[Renderer] Failed to initialize GLAD.\n";
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "[Renderer] OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";
    return true;
}

void GlGraphicsDevice::ConfigureDefaultState()
{
    glEnable(GL_DEPTH_TEST);
    // Every primitive is wound counter-clockwise when seen from outside.
    glEnable(GL_CULL_FACE);
    glCullFace(GL_BACK);
}

void GlGraphicsDevice::SetViewport(int width, int height)
{
    glViewport(0, 0, width, height);
}

void GlGraphicsDevice::Clear(const glm::vec3& color)
{
    glClearColor(color.r, color.g, color.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

unsigned int GlGraphicsDevice::CompileShader(unsigned int type, const char* source)
{
    const unsigned int shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(logLength), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        std::cerr << "[Shader] " << (type == GL_VERTEX_SHADER ? "Vertex" : "Fragment") << " compile error: " << log << "\n";
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

ProgramHandle GlGraphicsDevice::CreateProgram(const char* vertexSource, const char* fragmentSource)
{
    if (!m_loaded)
    {
        return kInvalidProgram;
    }

    const unsigned int vertexShader = CompileShader(GL_VERTEX_SHADER, vertexSource);
    const unsigned int fragmentShader = CompileShader(GL_FRAGMENT_SHADER, fragmentSource);
    if (vertexShader == 0 || fragmentShader == 0)
    {
        if (vertexShader != 0)
        {
            glDeleteShader(vertexShader);
        }
        if (fragmentShader != 0)
        {
            glDeleteShader(fragmentShader);
        }
        return kInvalidProgram;
    }

    const unsigned int program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(logLength), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        std::cerr << "[Shader] Program link error: " << log << "\n";

        glDeleteProgram(program);
        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        return kInvalidProgram;
    }

    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);
    return program;
}

void GlGraphicsDevice::DeleteProgram(ProgramHandle program)
{
    if (program == kInvalidProgram)
    {
        return;
    }
    m_uniformLocations.erase(program);
    if (m_loaded)
    {
        glDeleteProgram(program);
    }
}

void GlGraphicsDevice::UseProgram(ProgramHandle program)
{
    glUseProgram(program);
}

int GlGraphicsDevice::UniformLocation(ProgramHandle program, const std::string& name)
{
    auto& locations = m_uniformLocations[program];
    const auto it = locations.find(name);
    if (it != locations.end())
    {
        return it->second;
    }
    const int location = glGetUniformLocation(program, name.c_str());
    locations.emplace(name, location);
    return location;
}

void GlGraphicsDevice::SetUniform(ProgramHandle program, const std::string& name, const UniformValue& value)
{
    // Uniforms the compiler optimized away report -1; GL ignores them, so do we.
    const int location = UniformLocation(program, name);
    if (location < 0)
    {
        return;
    }

    switch (value.kind)
    {
        case UniformKind::Mat4:
            glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(value.AsMat4()));
            break;
        case UniformKind::Vec3:
            glUniform3fv(location, 1, glm::value_ptr(value.AsVec3()));
            break;
        case UniformKind::Vec2:
            glUniform2fv(location, 1, glm::value_ptr(value.AsVec2()));
            break;
        case UniformKind::Float:
            glUniform1f(location, value.AsFloat());
            break;
    }
}

GpuMeshId GlGraphicsDevice::UploadMesh(const assets::MeshData& mesh)
{
    if (!m_loaded || mesh.positions.empty() || mesh.indices.empty())
    {
        return kInvalidGpuMesh;
    }

    GpuMeshInfo info;
    glGenVertexArrays(1, &info.vao);
    glBindVertexArray(info.vao);

    info.positionVbo = UploadArrayBuffer(0, 3, &mesh.positions[0].x, mesh.positions.size() * 3U);
    if (!mesh.normals.empty())
    {
        info.normalVbo = UploadArrayBuffer(1, 3, &mesh.normals[0].x, mesh.normals.size() * 3U);
    }
    if (!mesh.uvs.empty())
    {
        info.uvVbo = UploadArrayBuffer(2, 2, &mesh.uvs[0].x, mesh.uvs.size() * 2U);
    }

    glGenBuffers(1, &info.ebo);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, info.ebo);
    glBufferData(
        GL_ELEMENT_ARRAY_BUFFER,
        static_cast<GLsizeiptr>(mesh.indices.size() * sizeof(std::uint32_t)),
        mesh.indices.data(),
        GL_STATIC_DRAW
    );
    info.indexCount = static_cast<std::uint32_t>(mesh.indices.size());

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    const GpuMeshId id = m_nextMeshId++;
    m_meshes[id] = info;
    return id;
}

void GlGraphicsDevice::DrawMesh(GpuMeshId mesh)
{
    const auto it = m_meshes.find(mesh);
    if (it == m_meshes.end() || it->second.indexCount == 0)
    {
        return;
    }
    glBindVertexArray(it->second.vao);
    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(it->second.indexCount), GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}

void GlGraphicsDevice::DeleteMeshBuffers(GpuMeshInfo& info)
{
    for (unsigned int* buffer : {&info.positionVbo, &info.normalVbo, &info.uvVbo, &info.ebo})
    {
        if (*buffer != 0)
        {
            glDeleteBuffers(1, buffer);
            *buffer = 0;
        }
    }
    if (info.vao != 0)
    {
        glDeleteVertexArrays(1, &info.vao);
        info.vao = 0;
    }
}

void GlGraphicsDevice::FreeMesh(GpuMeshId mesh)
{
    if (mesh == kInvalidGpuMesh)
    {
        return;
    }
    const auto it = m_meshes.find(mesh);
    if (it == m_meshes.end())
    {
        return;
    }
    DeleteMeshBuffers(it->second);
    m_meshes.erase(it);
}

void GlGraphicsDevice::FreeAllMeshes()
{
    if (m_loaded)
    {
        for (auto& [id, info] : m_meshes)
        {
            (void)id;
            DeleteMeshBuffers(info);
        }
    }
    m_meshes.clear();
}
} // namespace vista::render
