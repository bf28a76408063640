// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/scene/scene_loader.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "prism/core/log.h"

namespace prism {
namespace {

using nlohmann::json;

// Thrown while walking the document, converted to core::Error at the boundary
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

const json& Require(const json& node, const char* key, const std::string& where) {
    if (!node.is_object()) {
        throw FormatError(fmt::format("{}: expected an object", where));
    }
    auto it = node.find(key);
    if (it == node.end()) {
        throw FormatError(fmt::format("{}: missing key '{}'", where, key));
    }
    return *it;
}

Vec3 ReadVec3(const json& node, const std::string& where) {
    if (!node.is_array() || node.size() != 3) {
        throw FormatError(fmt::format("{}: expected an array of 3 numbers", where));
    }
    Vec3 result;
    for (int i = 0; i < 3; ++i) {
        if (!node[i].is_number()) {
            throw FormatError(fmt::format("{}[{}]: expected a number", where, i));
        }
        result[i] = node[i].get<double>();
    }
    return result;
}

double ReadNumber(const json& node, const std::string& where) {
    if (!node.is_number()) {
        throw FormatError(fmt::format("{}: expected a number", where));
    }
    return node.get<double>();
}

u32 ReadCount(const json& node, const std::string& where) {
    if (!node.is_number_unsigned()) {
        throw FormatError(fmt::format("{}: expected a non-negative integer", where));
    }
    const auto value = node.get<std::uint64_t>();
    if (value > std::numeric_limits<u32>::max()) {
        throw FormatError(fmt::format("{}: {} is out of range", where, value));
    }
    return static_cast<u32>(value);
}

Vec3 RequireVec3(const json& node, const char* key, const std::string& where) {
    return ReadVec3(Require(node, key, where), fmt::format("{}.{}", where, key));
}

double RequireNumber(const json& node, const char* key, const std::string& where) {
    return ReadNumber(Require(node, key, where), fmt::format("{}.{}", where, key));
}

Camera ReadCamera(const json& node) {
    const std::string where = "camera";
    Camera camera;
    camera.position = RequireVec3(node, "position", where);
    camera.direction = RequireVec3(node, "direction", where);
    camera.screen_distance = RequireNumber(node, "screenDistance", where);
    camera.screen_width = RequireNumber(node, "screenWidth", where);
    camera.screen_height = RequireNumber(node, "screenHeight", where);
    camera.screen_columns = ReadCount(Require(node, "screenColumns", where), "camera.screenColumns");
    camera.screen_rows = ReadCount(Require(node, "screenRows", where), "camera.screenRows");
    if (node.contains("worldUp")) {
        camera.world_up = ReadVec3(node["worldUp"], "camera.worldUp");
    }
    return camera;
}

Material ReadMaterial(const json& node, const std::string& where) {
    Material material;
    material.colour = RequireVec3(node, "colour", where);
    material.k_ambient = RequireNumber(node, "kAmbient", where);
    material.k_diffuse = RequireNumber(node, "kDiffuse", where);
    material.k_specular = RequireNumber(node, "kSpecular", where);
    material.shine = RequireNumber(node, "shine", where);
    if (node.contains("kReflect")) {
        material.k_reflect = ReadNumber(node["kReflect"], where + ".kReflect");
    }
    return material;
}

Shape ReadShape(const json& node, const std::string& where) {
    const auto& tag = Require(node, "type", where);
    if (!tag.is_string()) {
        throw FormatError(fmt::format("{}.type: expected a string", where));
    }

    const auto type = tag.get<std::string>();
    if (type == "sphere" || type == "Sphere") {
        return Sphere{RequireVec3(node, "centre", where), RequireNumber(node, "radius", where)};
    }
    if (type == "plane" || type == "Plane") {
        return Plane{RequireVec3(node, "point", where), RequireVec3(node, "normal", where)};
    }
    throw FormatError(fmt::format("{}.type: unknown shape type '{}'", where, type));
}

const json& RequireArray(const json& node, const char* key) {
    const auto& array = Require(node, key, "scene");
    if (!array.is_array()) {
        throw FormatError(fmt::format("scene.{}: expected an array", key));
    }
    return array;
}

Scene ReadScene(const json& root) {
    Scene scene;
    scene.camera = ReadCamera(Require(root, "camera", "scene"));
    scene.ambient_light = RequireVec3(root, "ambientLight", "scene");
    if (root.contains("backgroundColour")) {
        scene.background_colour = ReadVec3(root["backgroundColour"], "scene.backgroundColour");
    }

    const auto& lights = RequireArray(root, "lights");
    for (usize i = 0; i < lights.size(); ++i) {
        const auto where = fmt::format("lights[{}]", i);
        scene.lights.push_back(LightSource{
            RequireVec3(lights[i], "colour", where),
            RequireVec3(lights[i], "pos", where)
        });
    }

    const auto& objects = RequireArray(root, "objects");
    for (usize i = 0; i < objects.size(); ++i) {
        const auto where = fmt::format("objects[{}]", i);
        scene.objects.push_back(SceneObject{
            ReadShape(Require(objects[i], "shape", where), where + ".shape"),
            ReadMaterial(Require(objects[i], "material", where), where + ".material")
        });
    }

    return scene;
}

} // namespace

core::Result<Scene> ParseScene(const std::string& text) {
    Scene scene;
    try {
        scene = ReadScene(json::parse(text));
    } catch (const json::parse_error& err) {
        return core::MakeError(fmt::format("malformed JSON: {}", err.what()));
    } catch (const FormatError& err) {
        return core::MakeError(err.what());
    } catch (const json::exception& err) {
        return core::MakeError(err.what());
    }

    auto valid = ValidateScene(scene);
    if (valid.IsErr()) {
        return std::move(valid).GetError().WithContext("invalid scene");
    }

    PRISM_LOG_DEBUG("parsed scene: {} lights, {} objects, {}x{} pixels",
        scene.lights.size(), scene.objects.size(),
        scene.camera.screen_columns, scene.camera.screen_rows);
    for (usize i = 0; i < scene.objects.size(); ++i) {
        PRISM_LOG_TRACE("object {}: {}", i, ShapeName(scene.objects[i].shape));
    }
    return scene;
}

core::Result<Scene> LoadSceneFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::MakeError(fmt::format("Failed to open scene file: {}", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return ParseScene(buffer.str()).WithContext(path.string());
}

} // namespace prism
