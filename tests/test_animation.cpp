#include <catch2/catch.hpp>

#include <cmath>

#include "vista/animation/AnimationEvaluator.hpp"

using namespace vista;
using Catch::Matchers::WithinAbs;

namespace
{
math::Transform SampleTransform()
{
    math::Transform transform;
    transform.position = glm::vec3{1.0F, 2.0F, 3.0F};
    transform.rotation = glm::vec3{0.1F, 0.2F, 0.3F};
    transform.scale = glm::vec3{2.0F, 1.0F, 0.5F};
    return transform;
}

bool SameTransform(const math::Transform& a, const math::Transform& b)
{
    return a.position == b.position && a.rotation == b.rotation && a.scale == b.scale;
}

scene::AnimationSpec Spec(scene::AnimationType type, float speed, float amplitude)
{
    scene::AnimationSpec spec;
    spec.type = type;
    spec.speed = speed;
    spec.amplitude = amplitude;
    return spec;
}
} // namespace

TEST_CASE("Objects without animation are static", "[animation]")
{
    const math::Transform base = SampleTransform();
    REQUIRE(SameTransform(animation::Evaluate(base, std::nullopt, 12345.0), base));
}

TEST_CASE("Rotate animation", "[animation]")
{
    const math::Transform base = SampleTransform();

    SECTION("speed 0 leaves rotation unchanged")
    {
        const math::Transform result = animation::Evaluate(base, Spec(scene::AnimationType::Rotate, 0.0F, 0.0F), 5000.0);
        REQUIRE(result.rotation == base.rotation);
    }

    SECTION("adds the phase to yaw only")
    {
        const math::Transform result = animation::Evaluate(base, Spec(scene::AnimationType::Rotate, 2.0F, 0.0F), 1000.0);
        REQUIRE_THAT(result.rotation.y, WithinAbs(0.2F + 2.0F, 1e-5F));
        REQUIRE(result.rotation.x == base.rotation.x);
        REQUIRE(result.rotation.z == base.rotation.z);
        REQUIRE(result.position == base.position);
        REQUIRE(result.scale == base.scale);
    }
}

TEST_CASE("Float animation", "[animation]")
{
    const math::Transform base = SampleTransform();
    const scene::AnimationSpec spec = Spec(scene::AnimationType::Float, 1.0F, 0.2F);

    const math::Transform result = animation::Evaluate(base, spec, 500.0);
    REQUIRE_THAT(result.position.y, WithinAbs(2.0F + static_cast<float>(std::sin(0.5)) * 0.2F, 1e-5F));
    REQUIRE(result.position.x == base.position.x);
    REQUIRE(result.position.z == base.position.z);
    REQUIRE(result.rotation == base.rotation);
    REQUIRE(result.scale == base.scale);
}

TEST_CASE("Pulse animation", "[animation]")
{
    const math::Transform base = SampleTransform();

    SECTION("amplitude 0 leaves scale unchanged")
    {
        const math::Transform result = animation::Evaluate(base, Spec(scene::AnimationType::Pulse, 3.0F, 0.0F), 777.0);
        REQUIRE(result.scale == base.scale);
    }

    SECTION("scales every axis uniformly")
    {
        const math::Transform result = animation::Evaluate(base, Spec(scene::AnimationType::Pulse, 1.0F, 0.5F), 1000.0);
        const float factor = 1.0F + static_cast<float>(std::sin(1.0)) * 0.5F;
        REQUIRE_THAT(result.scale.x, WithinAbs(2.0F * factor, 1e-5F));
        REQUIRE_THAT(result.scale.y, WithinAbs(1.0F * factor, 1e-5F));
        REQUIRE_THAT(result.scale.z, WithinAbs(0.5F * factor, 1e-5F));
        REQUIRE(result.position == base.position);
    }
}

TEST_CASE("Unknown animation type is a no-op", "[animation]")
{
    const math::Transform base = SampleTransform();
    const math::Transform result = animation::Evaluate(base, Spec(scene::AnimationType::Unknown, 5.0F, 5.0F), 4321.0);
    REQUIRE(SameTransform(result, base));
}

TEST_CASE("Evaluation is pure", "[animation]")
{
    const math::Transform base = SampleTransform();
    const math::Transform copy = base;
    const scene::AnimationSpec spec = Spec(scene::AnimationType::Pulse, 2.0F, 0.1F);

    const math::Transform first = animation::Evaluate(base, spec, 1234.5);
    const math::Transform second = animation::Evaluate(base, spec, 1234.5);

    REQUIRE(SameTransform(first, second));
    REQUIRE(SameTransform(base, copy));
}

TEST_CASE("Animation phase", "[animation]")
{
    REQUIRE(animation::AnimationPhase(Spec(scene::AnimationType::Rotate, 2.0F, 0.0F), 1500.0) == Approx(3.0));
}
