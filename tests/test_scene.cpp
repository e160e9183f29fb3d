#include <catch2/catch.hpp>

#include "vista/scene/Scene.hpp"

using namespace vista::scene;

TEST_CASE("Hex color parsing", "[scene]")
{
    SECTION("with and without hash")
    {
        REQUIRE(ParseHexColor("#ff0000") == glm::vec3{1.0F, 0.0F, 0.0F});
        REQUIRE(ParseHexColor("00ff00") == glm::vec3{0.0F, 1.0F, 0.0F});
    }

    SECTION("case-insensitive")
    {
        REQUIRE(ParseHexColor("#0000FF") == ParseHexColor("#0000ff"));
    }

    SECTION("channels are divided by 255")
    {
        const glm::vec3 color = ParseHexColor("#003366");
        REQUIRE(color.r == 0.0F);
        REQUIRE(color.g == Approx(0x33 / 255.0F));
        REQUIRE(color.b == Approx(0x66 / 255.0F));
    }

    SECTION("malformed input is white")
    {
        REQUIRE(ParseHexColor("") == glm::vec3{1.0F});
        REQUIRE(ParseHexColor("#fff") == glm::vec3{1.0F});
        REQUIRE(ParseHexColor("#gg0000") == glm::vec3{1.0F});
        REQUIRE(ParseHexColor("#ff00000") == glm::vec3{1.0F});
    }

    SECTION("formatting is lowercase with hash")
    {
        REQUIRE(FormatHexColor(glm::vec3{1.0F, 0.0F, 0.4F}) == "#ff0066");
        REQUIRE(FormatHexColor(ParseHexColor("#1A1A2E")) == "#1a1a2e");
    }
}

TEST_CASE("Animation type names", "[scene]")
{
    REQUIRE(AnimationTypeFromString("rotate") == AnimationType::Rotate);
    REQUIRE(AnimationTypeFromString("float") == AnimationType::Float);
    REQUIRE(AnimationTypeFromString("pulse") == AnimationType::Pulse);
    REQUIRE(AnimationTypeFromString("spin") == AnimationType::Unknown);
    REQUIRE(std::string{AnimationTypeToString(AnimationType::Pulse)} == "pulse");
}

TEST_CASE("Scene lookup and defaults", "[scene]")
{
    Scene scene;
    SceneObject object;
    object.id = "panel";
    scene.objects.push_back(object);

    REQUIRE(FindObject(scene, "panel") == &scene.objects.front());
    REQUIRE(FindObject(scene, "missing") == nullptr);

    const Camera camera;
    REQUIRE(camera.position == glm::vec3{0.0F, 2.0F, 5.0F});
    REQUIRE(camera.fov == 60.0F);
}
