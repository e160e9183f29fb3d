#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "vista/core/ViewerConfig.hpp"

using namespace vista::core;

namespace
{
std::filesystem::path FreshPath(const std::string& name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("vista_config_" + name);
    std::filesystem::remove_all(dir);
    return dir / "config" / "viewer.json";
}
} // namespace

TEST_CASE("Viewer config", "[config]")
{
    SECTION("missing file is created with defaults")
    {
        const std::filesystem::path path = FreshPath("missing");
        ViewerConfig config;
        config.width = 1;
        std::string status;
        REQUIRE(LoadViewerConfig(path, &config, &status));
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(config.width == 1280);
        REQUIRE(config.initialScene == "space_station");
        REQUIRE_FALSE(status.empty());
    }

    SECTION("values are read and clamped")
    {
        const std::filesystem::path path = FreshPath("values");
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << R"({"width": 1920, "height": 100, "vsync": false, "fps_limit": -5,
            "scene_directory": "scenes", "initial_scene": "zen_garden", "camera_fov": 75.5,
            "stats_interval_seconds": 2})";

        ViewerConfig config;
        REQUIRE(LoadViewerConfig(path, &config));
        REQUIRE(config.width == 1920);
        REQUIRE(config.height == 240);
        REQUIRE_FALSE(config.vsync);
        REQUIRE(config.fpsLimit == 0);
        REQUIRE(config.sceneDirectory == "scenes");
        REQUIRE(config.initialScene == "zen_garden");
        REQUIRE(config.cameraFov == Approx(75.5F));
        REQUIRE(config.statsIntervalSeconds == Approx(2.0));
    }

    SECTION("wrongly typed values are ignored")
    {
        const std::filesystem::path path = FreshPath("types");
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << R"({"width": "wide", "vsync": 1})";

        ViewerConfig config;
        REQUIRE(LoadViewerConfig(path, &config));
        REQUIRE(config.width == 1280);
        REQUIRE(config.vsync);
    }

    SECTION("invalid JSON keeps defaults")
    {
        const std::filesystem::path path = FreshPath("invalid");
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << "{ broken";

        ViewerConfig config;
        std::string status;
        REQUIRE(LoadViewerConfig(path, &config, &status));
        REQUIRE(config.height == 720);
        REQUIRE(status.find("Invalid") != std::string::npos);
    }

    SECTION("saved config loads back")
    {
        const std::filesystem::path path = FreshPath("save");
        ViewerConfig saved;
        saved.fpsLimit = 144;
        saved.initialScene = "cyberpunk_city";
        REQUIRE(SaveViewerConfig(path, saved));

        ViewerConfig loaded;
        REQUIRE(LoadViewerConfig(path, &loaded));
        REQUIRE(loaded.fpsLimit == 144);
        REQUIRE(loaded.initialScene == "cyberpunk_city");
    }
}
