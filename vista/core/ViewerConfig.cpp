#include "vista/core/ViewerConfig.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

namespace vista::core
{
namespace
{
using json = nlohmann::json;

void SetStatus(std::string* outStatus, const std::string& status)
{
    if (outStatus != nullptr)
    {
        *outStatus = status;
    }
}
} // namespace

bool LoadViewerConfig(const std::filesystem::path& path, ViewerConfig* config, std::string* outStatus)
{
    if (config == nullptr)
    {
        return false;
    }
    *config = ViewerConfig{};

    if (!std::filesystem::exists(path))
    {
        SetStatus(outStatus, "Viewer config missing. Wrote defaults.");
        return SaveViewerConfig(path, *config);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetStatus(outStatus, "Failed to open viewer config.");
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        SetStatus(outStatus, "Invalid viewer JSON. Using defaults.");
        return true;
    }

    if (!root.is_object())
    {
        SetStatus(outStatus, "Viewer config is not an object. Using defaults.");
        return true;
    }

    if (root.contains("width") && root["width"].is_number_integer())
    {
        config->width = root["width"].get<int>();
    }
    if (root.contains("height") && root["height"].is_number_integer())
    {
        config->height = root["height"].get<int>();
    }
    if (root.contains("vsync") && root["vsync"].is_boolean())
    {
        config->vsync = root["vsync"].get<bool>();
    }
    if (root.contains("fps_limit") && root["fps_limit"].is_number_integer())
    {
        config->fpsLimit = root["fps_limit"].get<int>();
    }
    if (root.contains("scene_directory") && root["scene_directory"].is_string())
    {
        config->sceneDirectory = root["scene_directory"].get<std::string>();
    }
    if (root.contains("initial_scene") && root["initial_scene"].is_string())
    {
        config->initialScene = root["initial_scene"].get<std::string>();
    }
    if (root.contains("camera_fov") && root["camera_fov"].is_number())
    {
        config->cameraFov = root["camera_fov"].get<float>();
    }
    if (root.contains("stats_interval_seconds") && root["stats_interval_seconds"].is_number())
    {
        config->statsIntervalSeconds = root["stats_interval_seconds"].get<double>();
    }

    config->width = std::max(320, config->width);
    config->height = std::max(240, config->height);
    config->fpsLimit = std::max(0, config->fpsLimit);
    config->cameraFov = std::clamp(config->cameraFov, 10.0F, 170.0F);
    config->statsIntervalSeconds = std::max(0.1, config->statsIntervalSeconds);
    SetStatus(outStatus, "Viewer config loaded.");
    return true;
}

bool SaveViewerConfig(const std::filesystem::path& path, const ViewerConfig& config)
{
    if (path.has_parent_path())
    {
        std::error_code error;
        std::filesystem::create_directories(path.parent_path(), error);
        if (error)
        {
            return false;
        }
    }

    json root;
    root["width"] = config.width;
    root["height"] = config.height;
    root["vsync"] = config.vsync;
    root["fps_limit"] = config.fpsLimit;
    root["scene_directory"] = config.sceneDirectory;
    root["initial_scene"] = config.initialScene;
    root["camera_fov"] = config.cameraFov;
    root["stats_interval_seconds"] = config.statsIntervalSeconds;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}
} // namespace vista::core
