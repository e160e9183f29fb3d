#pragma once

namespace vista::render
{
struct DrawableSize
{
    int width = 0;
    int height = 0;
};

/// Something the renderer can draw into: logical size plus the pixel ratio
/// between logical units and framebuffer pixels.
class IRenderSurface
{
public:
    virtual ~IRenderSurface() = default;

    [[nodiscard]] virtual int LogicalWidth() const = 0;
    [[nodiscard]] virtual int LogicalHeight() const = 0;
    [[nodiscard]] virtual float DevicePixelRatio() const = 0;
};

/// Logical size times device pixel ratio, rounded to whole pixels.
[[nodiscard]] DrawableSize ComputeDrawableSize(const IRenderSurface& surface);
} // namespace vista::render
