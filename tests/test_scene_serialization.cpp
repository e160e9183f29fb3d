#include <catch2/catch.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "vista/scene/SceneSerialization.hpp"

using namespace vista::scene;

namespace
{
const char* kSpaceStation = R"({
  "id": "space_station",
  "name": "Space Station",
  "environment": {
    "lighting": {
      "ambient": "#1a1a2e",
      "directional": { "color": "#ffffff", "intensity": 1.2, "position": { "x": 10, "y": 10, "z": 10 } }
    },
    "fog": { "color": "#16213e", "near": 50, "far": 200 }
  },
  "objects": [
    {
      "id": "control_panel",
      "name": "Control Panel",
      "position": { "x": 0, "y": 1, "z": -2 },
      "rotation": [-0.3, 0, 0],
      "scale": { "x": 2, "y": 1, "z": 0.1 },
      "material": { "color": "#003366", "metallic": 1.8, "roughness": -0.2, "emission": "#0066cc" },
      "geometry": { "type": "box", "parameters": { "width": 1, "height": 1, "depth": 1, "label": "ignored" } },
      "animation": { "type": "pulse", "speed": 2, "amplitude": 0.1 },
      "interactive": true
    },
    { "id": "bare" }
  ]
})";

std::filesystem::path MakeTempDirectory(const std::string& name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("vista_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}
} // namespace

TEST_CASE("Scene JSON parsing", "[scene][json]")
{
    Scene scene;
    std::string error;
    REQUIRE(ParseScene(kSpaceStation, &scene, &error));
    REQUIRE(error.empty());

    SECTION("environment")
    {
        REQUIRE(scene.id == "space_station");
        REQUIRE(scene.name == "Space Station");
        REQUIRE(scene.ambientColor == ParseHexColor("#1a1a2e"));
        REQUIRE(scene.directionalLight.intensity == Approx(1.2F));
        REQUIRE(scene.directionalLight.direction == glm::vec3{10.0F, 10.0F, 10.0F});
        REQUIRE(scene.fog.nearDistance == 50.0F);
        REQUIRE(scene.fog.farDistance == 200.0F);
    }

    SECTION("object fields")
    {
        REQUIRE(scene.objects.size() == 2);
        const SceneObject& panel = scene.objects[0];
        REQUIRE(panel.id == "control_panel");
        REQUIRE(panel.transform.position == glm::vec3{0.0F, 1.0F, -2.0F});
        REQUIRE(panel.transform.rotation.x == Approx(-0.3F));
        REQUIRE(panel.transform.scale.z == Approx(0.1F));
        REQUIRE(panel.material.emission.has_value());
        REQUIRE(panel.geometry.type == "box");
        REQUIRE(panel.geometry.parameters.size() == 3);
        REQUIRE(panel.animation.has_value());
        REQUIRE(panel.animation->type == AnimationType::Pulse);
        REQUIRE(panel.animation->speed == 2.0F);
        REQUIRE(panel.interactive);
    }

    SECTION("material factors are clamped")
    {
        REQUIRE(scene.objects[0].material.metallic == 1.0F);
        REQUIRE(scene.objects[0].material.roughness == 0.0F);
    }

    SECTION("missing fields keep defaults")
    {
        const SceneObject& bare = scene.objects[1];
        REQUIRE(bare.name == "bare");
        REQUIRE(bare.transform.scale == glm::vec3{1.0F});
        REQUIRE(bare.geometry.type == "box");
        REQUIRE_FALSE(bare.animation.has_value());
        REQUIRE_FALSE(bare.material.emission.has_value());
        REQUIRE_FALSE(bare.interactive);
    }
}

TEST_CASE("Scene JSON errors", "[scene][json]")
{
    Scene scene;
    scene.id = "untouched";
    std::string error;

    SECTION("invalid JSON")
    {
        REQUIRE_FALSE(ParseScene("{ not json", &scene, &error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(scene.id == "untouched");
    }

    SECTION("non-object root")
    {
        REQUIRE_FALSE(ParseScene("[1, 2, 3]", &scene, &error));
        REQUIRE(scene.id == "untouched");
    }

    SECTION("wrongly typed field")
    {
        REQUIRE_FALSE(ParseScene(R"({"id": 5})", &scene, &error));
        REQUIRE(scene.id == "untouched");
    }

    SECTION("out of range geometry parameters are reported and kept infinite")
    {
        std::ostringstream captured;
        std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());
        const bool parsed = ParseScene(
            R"({"objects": [{"id": "big", "geometry": {"type": "box", "parameters": {"width": 1e40, "depth": -1e40, "height": 2}}}]})",
            &scene,
            &error
        );
        std::cerr.rdbuf(previous);

        REQUIRE(parsed);
        const std::map<std::string, float>& parameters = scene.objects[0].geometry.parameters;
        REQUIRE(std::isinf(parameters.at("width")));
        REQUIRE(parameters.at("width") > 0.0F);
        REQUIRE(std::isinf(parameters.at("depth")));
        REQUIRE(parameters.at("depth") < 0.0F);
        REQUIRE(parameters.at("height") == 2.0F);
        REQUIRE(captured.str().find("'width'") != std::string::npos);
        REQUIRE(captured.str().find("'depth'") != std::string::npos);
        REQUIRE(captured.str().find("'height'") == std::string::npos);
    }

    SECTION("unknown animation type is kept as a no-op")
    {
        REQUIRE(ParseScene(R"({"objects": [{"id": "a", "animation": {"type": "wobble"}}]})", &scene, &error));
        REQUIRE(scene.objects[0].animation->type == AnimationType::Unknown);
    }
}

TEST_CASE("Scene files", "[scene][json]")
{
    const std::filesystem::path dir = MakeTempDirectory("scene_files");

    SECTION("save then load preserves the scene")
    {
        Scene original;
        REQUIRE(ParseScene(kSpaceStation, &original));
        REQUIRE(SaveSceneFile(original, dir / "station.json"));

        Scene loaded;
        std::string error;
        REQUIRE(LoadSceneFile(dir / "station.json", &loaded, &error));
        REQUIRE(loaded.id == original.id);
        REQUIRE(loaded.objects.size() == original.objects.size());
        REQUIRE(FormatHexColor(loaded.ambientColor) == "#1a1a2e");
        REQUIRE(loaded.objects[0].geometry.parameters == original.objects[0].geometry.parameters);
        REQUIRE(loaded.objects[0].animation->amplitude == Approx(0.1F));
    }

    SECTION("missing file reports the path")
    {
        Scene loaded;
        std::string error;
        REQUIRE_FALSE(LoadSceneFile(dir / "absent.json", &loaded, &error));
        REQUIRE(error.find("absent.json") != std::string::npos);
    }

    SECTION("listing returns sorted json files only")
    {
        std::ofstream(dir / "b.json") << "{}";
        std::ofstream(dir / "a.json") << "{}";
        std::ofstream(dir / "notes.txt") << "x";
        const std::vector<std::filesystem::path> files = ListSceneFiles(dir);
        REQUIRE(files.size() == 2);
        REQUIRE(files[0].filename() == "a.json");
        REQUIRE(files[1].filename() == "b.json");
        REQUIRE(ListSceneFiles(dir / "nowhere").empty());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Bundled scenes load", "[scene][json]")
{
    const std::vector<std::filesystem::path> files = ListSceneFiles(std::filesystem::path(VISTA_SOURCE_DIR) / "assets" / "scenes");
    REQUIRE(files.size() == 4);
    for (const std::filesystem::path& path : files)
    {
        Scene scene;
        std::string error;
        INFO(path.string());
        REQUIRE(LoadSceneFile(path, &scene, &error));
        REQUIRE(scene.objects.size() == 1);
        REQUIRE(scene.id == path.stem().string());
    }
}
