#include "vista/render/RenderSurface.hpp"

#include <algorithm>
#include <cmath>

namespace vista::render
{
DrawableSize ComputeDrawableSize(const IRenderSurface& surface)
{
    const float ratio = surface.DevicePixelRatio() > 0.0F ? surface.DevicePixelRatio() : 1.0F;
    DrawableSize size;
    size.width = std::max(0, static_cast<int>(std::lround(static_cast<float>(surface.LogicalWidth()) * ratio)));
    size.height = std::max(0, static_cast<int>(std::lround(static_cast<float>(surface.LogicalHeight()) * ratio)));
    return size;
}
} // namespace vista::render
