#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "vista/scene/Scene.hpp"

namespace vista::scene
{
/// Reads the scene JSON layout (environment.lighting, fog, objects[]).
/// Missing fields keep their defaults; metallic/roughness are clamped to [0, 1].
bool ParseScene(const std::string& text, Scene* outScene, std::string* outError = nullptr);
bool LoadSceneFile(const std::filesystem::path& path, Scene* outScene, std::string* outError = nullptr);

[[nodiscard]] std::string SerializeScene(const Scene& scene);
bool SaveSceneFile(const Scene& scene, const std::filesystem::path& path, std::string* outError = nullptr);

/// Sorted *.json files directly under |directory|; empty when it does not exist.
[[nodiscard]] std::vector<std::filesystem::path> ListSceneFiles(const std::filesystem::path& directory);
} // namespace vista::scene
