#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <prism/scene/scene_loader.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace prism;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

const char* kSceneJson = R"({
    "camera": {
        "position": [0, -10, 0],
        "direction": [0, 1, 0],
        "screenDistance": 2.0,
        "screenWidth": 1.6,
        "screenHeight": 0.9,
        "screenColumns": 160,
        "screenRows": 90
    },
    "ambientLight": [0.1, 0.1, 0.1],
    "lights": [
        { "colour": [1, 1, 1], "pos": [0, 0, 5] }
    ],
    "objects": [
        {
            "material": { "colour": [1, 0, 0], "kDiffuse": 0.8, "kAmbient": 1.0, "kSpecular": 0.5, "shine": 32 },
            "shape": { "type": "sphere", "centre": [0, 0, 0], "radius": 1.5 }
        },
        {
            "material": { "colour": [0.5, 0.5, 0.5], "kDiffuse": 0.5, "kAmbient": 0.5, "kSpecular": 0, "kReflect": 0.25, "shine": 1 },
            "shape": { "type": "Plane", "point": [0, 0, -1.5], "normal": [0, 0, 1] }
        }
    ]
})";

std::string Replace(std::string text, const std::string& from, const std::string& to) {
    const auto pos = text.find(from);
    REQUIRE(pos != std::string::npos);
    text.replace(pos, from.size(), to);
    return text;
}

} // namespace

TEST_CASE("Scene document parsing", "[scene][loader]") {
    auto result = ParseScene(kSceneJson);
    REQUIRE(result.IsOk());
    const Scene& scene = result.Value();

    SECTION("Camera") {
        REQUIRE(scene.camera.position == Vec3(0.0, -10.0, 0.0));
        REQUIRE(scene.camera.direction == Vec3(0.0, 1.0, 0.0));
        REQUIRE_THAT(scene.camera.screen_distance, WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(scene.camera.screen_width, WithinAbs(1.6, 1e-12));
        REQUIRE_THAT(scene.camera.screen_height, WithinAbs(0.9, 1e-12));
        REQUIRE(scene.camera.screen_columns == 160);
        REQUIRE(scene.camera.screen_rows == 90);
        REQUIRE(scene.camera.world_up == kDefaultWorldUp);
    }

    SECTION("Lighting") {
        REQUIRE(scene.ambient_light == Colour(0.1, 0.1, 0.1));
        REQUIRE(scene.background_colour == Colour(0.0));
        REQUIRE(scene.lights.size() == 1);
        REQUIRE(scene.lights[0].pos == Vec3(0.0, 0.0, 5.0));
    }

    SECTION("Objects") {
        REQUIRE(scene.objects.size() == 2);

        const auto* sphere = std::get_if<Sphere>(&scene.objects[0].shape);
        REQUIRE(sphere != nullptr);
        REQUIRE_THAT(sphere->radius, WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(scene.objects[0].material.k_specular, WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(scene.objects[0].material.shine, WithinAbs(32.0, 1e-12));
        REQUIRE(scene.objects[0].material.k_reflect == 0.0);

        const auto* plane = std::get_if<Plane>(&scene.objects[1].shape);
        REQUIRE(plane != nullptr);
        REQUIRE(plane->point == Vec3(0.0, 0.0, -1.5));
        REQUIRE_THAT(scene.objects[1].material.k_reflect, WithinAbs(0.25, 1e-12));
    }
}

TEST_CASE("Optional scene keys", "[scene][loader]") {
    std::string text = Replace(kSceneJson, "\"ambientLight\"",
        "\"backgroundColour\": [0.2, 0.3, 0.4], \"ambientLight\"");
    text = Replace(text, "\"screenRows\": 90", "\"screenRows\": 90, \"worldUp\": [0, 0, -1]");

    auto result = ParseScene(text);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().background_colour == Colour(0.2, 0.3, 0.4));
    REQUIRE(result.Value().camera.world_up == Vec3(0.0, 0.0, -1.0));
}

TEST_CASE("Scene document errors", "[scene][loader]") {
    SECTION("Malformed JSON") {
        auto result = ParseScene("{ \"camera\": ");
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("malformed JSON"));
    }

    SECTION("Missing key names its location") {
        auto result = ParseScene(Replace(kSceneJson, "\"radius\": 1.5", "\"r\": 1.5"));
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("objects[0].shape"));
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("radius"));
    }

    SECTION("Wrong vector arity") {
        auto result = ParseScene(Replace(kSceneJson, "\"pos\": [0, 0, 5]", "\"pos\": [0, 5]"));
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("lights[0].pos"));
    }

    SECTION("Unknown shape type") {
        auto result = ParseScene(Replace(kSceneJson, "\"type\": \"sphere\"", "\"type\": \"torus\""));
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("torus"));
    }

    SECTION("Negative pixel count") {
        auto result = ParseScene(Replace(kSceneJson, "\"screenRows\": 90", "\"screenRows\": -90"));
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("screenRows"));
    }

    SECTION("Pixel count beyond 32 bits") {
        auto result = ParseScene(Replace(kSceneJson, "\"screenColumns\": 160", "\"screenColumns\": 4294967297"));
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("screenColumns"));
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("out of range"));
    }

    SECTION("Parsed but invalid scene") {
        auto result = ParseScene(Replace(kSceneJson, "\"direction\": [0, 1, 0]", "\"direction\": [0, 0, 1]"));
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("invalid scene"));
    }
}

TEST_CASE("Scene files", "[scene][loader]") {
    SECTION("Missing file") {
        auto result = LoadSceneFromFile("does/not/exist.json");
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("Failed to open"));
    }

    SECTION("Round trip through disk") {
        const auto path = std::filesystem::temp_directory_path() / "prism_test_scene.json";
        {
            std::ofstream out(path);
            out << kSceneJson;
        }

        auto result = LoadSceneFromFile(path);
        std::filesystem::remove(path);

        REQUIRE(result.IsOk());
        REQUIRE(result.Value().objects.size() == 2);
    }

    SECTION("File errors carry the path") {
        const auto path = std::filesystem::temp_directory_path() / "prism_test_broken.json";
        {
            std::ofstream out(path);
            out << "[]";
        }

        auto result = LoadSceneFromFile(path);
        std::filesystem::remove(path);

        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.GetError().Message, ContainsSubstring("prism_test_broken.json"));
    }
}
