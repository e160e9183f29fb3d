#pragma once

#include <filesystem>
#include <string>

namespace vista::core
{
struct ViewerConfig
{
    int width = 1280;
    int height = 720;
    bool vsync = true;
    int fpsLimit = 0;
    std::string sceneDirectory = "assets/scenes";
    std::string initialScene = "space_station";
    float cameraFov = 60.0F;
    double statsIntervalSeconds = 1.0;
};

/// Reads |path| into |config|. A missing file is created with defaults and
/// invalid JSON keeps the defaults; |outStatus| then describes what happened.
/// Returns false only when the file exists but cannot be read or rewritten.
bool LoadViewerConfig(const std::filesystem::path& path, ViewerConfig* config, std::string* outStatus = nullptr);
bool SaveViewerConfig(const std::filesystem::path& path, const ViewerConfig& config);
} // namespace vista::core
