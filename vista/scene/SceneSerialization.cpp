#include "vista/scene/SceneSerialization.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace vista::scene
{
namespace
{
using json = nlohmann::json;

json Vec3ToJson(const glm::vec3& value)
{
    return json::object({{"x", value.x}, {"y", value.y}, {"z", value.z}});
}

glm::vec3 Vec3FromJson(const json& value, const glm::vec3& fallback)
{
    if (value.is_object())
    {
        return glm::vec3{
            value.value("x", fallback.x),
            value.value("y", fallback.y),
            value.value("z", fallback.z),
        };
    }
    if (value.is_array() && value.size() == 3 && value.at(0).is_number() && value.at(1).is_number() && value.at(2).is_number())
    {
        return glm::vec3{
            value.at(0).get<float>(),
            value.at(1).get<float>(),
            value.at(2).get<float>(),
        };
    }
    return fallback;
}

glm::vec3 ColorFromJson(const json& parent, const char* key, const glm::vec3& fallback)
{
    if (parent.contains(key) && parent[key].is_string())
    {
        return ParseHexColor(parent[key].get<std::string>());
    }
    return fallback;
}

SceneObject ObjectFromJson(const json& item)
{
    SceneObject object;
    object.id = item.value("id", std::string{});
    object.name = item.value("name", object.id);
    object.transform.position = Vec3FromJson(item.value("position", json{}), glm::vec3{0.0F});
    object.transform.rotation = Vec3FromJson(item.value("rotation", json{}), glm::vec3{0.0F});
    object.transform.scale = Vec3FromJson(item.value("scale", json{}), glm::vec3{1.0F});
    object.interactive = item.value("interactive", false);

    const json material = item.value("material", json::object());
    object.material.color = ColorFromJson(material, "color", object.material.color);
    object.material.metallic = std::clamp(material.value("metallic", object.material.metallic), 0.0F, 1.0F);
    object.material.roughness = std::clamp(material.value("roughness", object.material.roughness), 0.0F, 1.0F);
    if (material.contains("emission") && material["emission"].is_string())
    {
        object.material.emission = ParseHexColor(material["emission"].get<std::string>());
    }

    const json geometry = item.value("geometry", json::object());
    object.geometry.type = geometry.value("type", std::string{"box"});
    const json parameters = geometry.value("parameters", json::object());
    if (parameters.is_object())
    {
        for (const auto& [name, value] : parameters.items())
        {
            if (value.is_number())
            {
                const double number = value.get<double>();
                if (std::abs(number) <= static_cast<double>(std::numeric_limits<float>::max()))
                {
                    object.geometry.parameters[name] = static_cast<float>(number);
                    continue;
                }
                // Kept as infinity so the geometry cache rejects it.
                std::cerr << "[Scene] Object '" << object.id << "' geometry parameter '" << name
                          << "' is out of float range: " << number << "\n";
                object.geometry.parameters[name] =
                    number > 0.0 ? std::numeric_limits<float>::infinity() : -std::numeric_limits<float>::infinity();
            }
        }
    }

    if (item.contains("animation") && item["animation"].is_object())
    {
        const json& animation = item["animation"];
        AnimationSpec spec;
        spec.type = AnimationTypeFromString(animation.value("type", std::string{}));
        spec.speed = animation.value("speed", spec.speed);
        spec.amplitude = animation.value("amplitude", spec.amplitude);
        object.animation = spec;
    }
    return object;
}

json ObjectToJson(const SceneObject& object)
{
    json material = {
        {"color", FormatHexColor(object.material.color)},
        {"metallic", object.material.metallic},
        {"roughness", object.material.roughness},
    };
    if (object.material.emission.has_value())
    {
        material["emission"] = FormatHexColor(*object.material.emission);
    }

    json parameters = json::object();
    for (const auto& [name, value] : object.geometry.parameters)
    {
        parameters[name] = value;
    }

    json root = {
        {"id", object.id},
        {"name", object.name},
        {"position", Vec3ToJson(object.transform.position)},
        {"rotation", Vec3ToJson(object.transform.rotation)},
        {"scale", Vec3ToJson(object.transform.scale)},
        {"material", material},
        {"geometry", {{"type", object.geometry.type}, {"parameters", parameters}}},
        {"interactive", object.interactive},
    };
    if (object.animation.has_value())
    {
        root["animation"] = {
            {"type", AnimationTypeToString(object.animation->type)},
            {"speed", object.animation->speed},
            {"amplitude", object.animation->amplitude},
        };
    }
    return root;
}
} // namespace

bool ParseScene(const std::string& text, Scene* outScene, std::string* outError)
{
    if (outScene == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Scene output is null.";
        }
        return false;
    }

    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid scene JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Scene root must be an object.";
        }
        return false;
    }

    try
    {
        Scene result;
        result.id = root.value("id", std::string{});
        result.name = root.value("name", result.id);

        const json environment = root.value("environment", json::object());
        const json lighting = environment.value("lighting", json::object());
        result.ambientColor = ColorFromJson(lighting, "ambient", result.ambientColor);

        const json directional = lighting.value("directional", json::object());
        result.directionalLight.color = ColorFromJson(directional, "color", result.directionalLight.color);
        result.directionalLight.intensity = directional.value("intensity", result.directionalLight.intensity);
        result.directionalLight.direction = Vec3FromJson(directional.value("position", json{}), result.directionalLight.direction);

        const json fog = environment.value("fog", json::object());
        result.fog.color = ColorFromJson(fog, "color", result.fog.color);
        result.fog.nearDistance = fog.value("near", result.fog.nearDistance);
        result.fog.farDistance = fog.value("far", result.fog.farDistance);

        const json objects = root.value("objects", json::array());
        if (objects.is_array())
        {
            for (const json& item : objects)
            {
                if (item.is_object())
                {
                    result.objects.push_back(ObjectFromJson(item));
                }
            }
        }

        *outScene = std::move(result);
    }
    catch (const json::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Malformed scene field: "} + ex.what();
        }
        return false;
    }
    return true;
}

bool LoadSceneFile(const std::filesystem::path& path, Scene* outScene, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open scene file: " + path.string();
        }
        return false;
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    std::string parseError;
    if (!ParseScene(buffer.str(), outScene, &parseError))
    {
        if (outError != nullptr)
        {
            *outError = path.string() + ": " + parseError;
        }
        return false;
    }
    return true;
}

std::string SerializeScene(const Scene& scene)
{
    json objects = json::array();
    for (const SceneObject& object : scene.objects)
    {
        objects.push_back(ObjectToJson(object));
    }

    const json root = {
        {"id", scene.id},
        {"name", scene.name},
        {"environment",
         {
             {"lighting",
              {
                  {"ambient", FormatHexColor(scene.ambientColor)},
                  {"directional",
                   {
                       {"color", FormatHexColor(scene.directionalLight.color)},
                       {"intensity", scene.directionalLight.intensity},
                       {"position", Vec3ToJson(scene.directionalLight.direction)},
                   }},
              }},
             {"fog",
              {
                  {"color", FormatHexColor(scene.fog.color)},
                  {"near", scene.fog.nearDistance},
                  {"far", scene.fog.farDistance},
              }},
         }},
        {"objects", objects},
    };
    return root.dump(2);
}

bool SaveSceneFile(const Scene& scene, const std::filesystem::path& path, std::string* outError)
{
    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open file for writing: " + path.string();
        }
        return false;
    }
    stream << SerializeScene(scene) << "\n";
    return true;
}

std::vector<std::filesystem::path> ListSceneFiles(const std::filesystem::path& directory)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec))
    {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".json")
        {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}
} // namespace vista::scene
