#pragma once

#include <optional>

#include "vista/math/Transform.hpp"
#include "vista/scene/Scene.hpp"

namespace vista::animation
{
/// Effective transform of |base| at absolute time |timeMs|. Pure: the same
/// inputs always give bit-identical output and |base| is never modified.
/// No animation or an unknown type returns |base| unchanged.
[[nodiscard]] math::Transform Evaluate(
    const math::Transform& base,
    const std::optional<scene::AnimationSpec>& animation,
    double timeMs
);

/// Phase shared by every animation type: timeMs * speed * 0.001.
[[nodiscard]] double AnimationPhase(const scene::AnimationSpec& animation, double timeMs);
} // namespace vista::animation
