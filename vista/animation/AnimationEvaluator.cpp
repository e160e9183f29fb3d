#include "vista/animation/AnimationEvaluator.hpp"

#include <cmath>

namespace vista::animation
{
double AnimationPhase(const scene::AnimationSpec& animation, double timeMs)
{
    return timeMs * static_cast<double>(animation.speed) * 0.001;
}

math::Transform Evaluate(
    const math::Transform& base,
    const std::optional<scene::AnimationSpec>& animation,
    double timeMs
)
{
    math::Transform result = base;
    if (!animation.has_value())
    {
        return result;
    }

    const double phase = AnimationPhase(*animation, timeMs);
    switch (animation->type)
    {
        case scene::AnimationType::Rotate:
            result.rotation.y = static_cast<float>(static_cast<double>(base.rotation.y) + phase);
            break;
        case scene::AnimationType::Float:
            result.position.y = static_cast<float>(
                static_cast<double>(base.position.y) + std::sin(phase) * static_cast<double>(animation->amplitude)
            );
            break;
        case scene::AnimationType::Pulse:
        {
            const float pulse = static_cast<float>(1.0 + std::sin(phase) * static_cast<double>(animation->amplitude));
            result.scale = base.scale * pulse;
            break;
        }
        case scene::AnimationType::Unknown:
        default:
            break;
    }
    return result;
}
} // namespace vista::animation
