#include "vista/render/ShaderProgramManager.hpp"

#include <iostream>

namespace vista::render
{
namespace
{
constexpr const char* kStandardVertexShader = R"(
#version 450 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aNormal;
layout (location = 2) in vec2 aUv;

uniform mat4 modelMatrix;
uniform mat4 viewMatrix;
uniform mat4 projectionMatrix;
uniform mat4 normalMatrix;

out vec3 vNormal;
out vec2 vUv;
out vec3 vWorldPosition;

void main()
{
    vUv = aUv;
    vNormal = normalize((normalMatrix * vec4(aNormal, 0.0)).xyz);

    vec4 worldPosition = modelMatrix * vec4(aPosition, 1.0);
    vWorldPosition = worldPosition.xyz;

    gl_Position = projectionMatrix * viewMatrix * worldPosition;
}
)";

constexpr const char* kStandardFragmentShader = R"(
#version 450 core
in vec3 vNormal;
in vec2 vUv;
in vec3 vWorldPosition;
out vec4 FragColor;

uniform vec3 color;
uniform vec3 emissionColor;
uniform float metallic;
uniform float roughness;
uniform vec3 lightDirection;
uniform vec3 lightColor;
uniform vec3 ambientColor;
uniform vec3 cameraPosition;
uniform float time;

void main()
{
    vec3 normal = normalize(vNormal);
    vec3 viewDirection = normalize(cameraPosition - vWorldPosition);
    vec3 lightDir = normalize(-lightDirection);

    float NdotL = max(dot(normal, lightDir), 0.0);
    vec3 diffuse = color * lightColor * NdotL;

    vec3 reflectDir = reflect(-lightDir, normal);
    float spec = pow(max(dot(viewDirection, reflectDir), 0.0), 32.0 * (1.0 - roughness));
    vec3 specular = lightColor * spec * metallic;

    vec3 ambient = ambientColor * color;
    vec3 emission = emissionColor * (0.8 + 0.2 * sin(time * 2.0));

    FragColor = vec4(ambient + diffuse + specular + emission, 1.0);
}
)";
} // namespace

ShaderProgramManager::ShaderProgramManager(IGraphicsDevice& device)
    : m_device(device)
{
}

ShaderProgramManager::~ShaderProgramManager()
{
    Release();
}

std::optional<ProgramHandle> ShaderProgramManager::BuildStandardProgram()
{
    Release();

    const ProgramHandle program = m_device.CreateProgram(kStandardVertexShader, kStandardFragmentShader);
    if (program == kInvalidProgram)
    {
        std::cerr << "[Shader] Standard program unavailable.\n";
        return std::nullopt;
    }

    m_standardProgram = program;
    return m_standardProgram;
}

void ShaderProgramManager::Release()
{
    if (m_standardProgram.has_value())
    {
        m_device.DeleteProgram(*m_standardProgram);
        m_standardProgram.reset();
    }
}

const char* ShaderProgramManager::StandardVertexSource()
{
    return kStandardVertexShader;
}

const char* ShaderProgramManager::StandardFragmentSource()
{
    return kStandardFragmentShader;
}
} // namespace vista::render
