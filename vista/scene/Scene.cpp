#include "vista/scene/Scene.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace vista::scene
{
namespace
{
int HexDigit(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    const int lower = std::tolower(static_cast<unsigned char>(c));
    if (lower >= 'a' && lower <= 'f')
    {
        return lower - 'a' + 10;
    }
    return -1;
}

int ToByte(float channel)
{
    return static_cast<int>(std::lround(std::clamp(channel, 0.0F, 1.0F) * 255.0F));
}
} // namespace

glm::vec3 ParseHexColor(const std::string& text)
{
    const std::size_t offset = (!text.empty() && text[0] == '#') ? 1U : 0U;
    if (text.size() - offset != 6U)
    {
        return glm::vec3{1.0F};
    }

    glm::vec3 color{0.0F};
    for (int channel = 0; channel < 3; ++channel)
    {
        const int hi = HexDigit(text[offset + static_cast<std::size_t>(channel) * 2U]);
        const int lo = HexDigit(text[offset + static_cast<std::size_t>(channel) * 2U + 1U]);
        if (hi < 0 || lo < 0)
        {
            return glm::vec3{1.0F};
        }
        color[channel] = static_cast<float>(hi * 16 + lo) / 255.0F;
    }
    return color;
}

std::string FormatHexColor(const glm::vec3& color)
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", ToByte(color.r), ToByte(color.g), ToByte(color.b));
    return buffer;
}

AnimationType AnimationTypeFromString(const std::string& text)
{
    if (text == "rotate")
    {
        return AnimationType::Rotate;
    }
    if (text == "float")
    {
        return AnimationType::Float;
    }
    if (text == "pulse")
    {
        return AnimationType::Pulse;
    }
    return AnimationType::Unknown;
}

const char* AnimationTypeToString(AnimationType type)
{
    switch (type)
    {
        case AnimationType::Rotate: return "rotate";
        case AnimationType::Float: return "float";
        case AnimationType::Pulse: return "pulse";
        case AnimationType::Unknown: break;
    }
    return "unknown";
}

const SceneObject* FindObject(const Scene& scene, const std::string& objectId)
{
    const auto it = std::find_if(scene.objects.begin(), scene.objects.end(), [&objectId](const SceneObject& object) {
        return object.id == objectId;
    });
    return it != scene.objects.end() ? &*it : nullptr;
}
} // namespace vista::scene
