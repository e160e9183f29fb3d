#pragma once

#include <optional>

#include "vista/render/GraphicsDevice.hpp"

namespace vista::render
{
/// Owns the standard lit program. Build failures are logged by the device and
/// reported here as an empty handle; nothing is thrown.
class ShaderProgramManager
{
public:
    explicit ShaderProgramManager(IGraphicsDevice& device);
    ~ShaderProgramManager();

    ShaderProgramManager(const ShaderProgramManager&) = delete;
    ShaderProgramManager& operator=(const ShaderProgramManager&) = delete;

    /// Replaces the current standard program. On failure the old program is
    /// released as well and StandardProgram() becomes empty.
    std::optional<ProgramHandle> BuildStandardProgram();
    void Release();

    [[nodiscard]] std::optional<ProgramHandle> StandardProgram() const { return m_standardProgram; }

    [[nodiscard]] static const char* StandardVertexSource();
    [[nodiscard]] static const char* StandardFragmentSource();

private:
    IGraphicsDevice& m_device;
    std::optional<ProgramHandle> m_standardProgram;
};
} // namespace vista::render
