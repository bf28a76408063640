// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include "prism/core/result.h"
#include "prism/scene/scene.h"

namespace prism {

/**
 * Scene documents are JSON objects with camelCase keys:
 *
 *   {
 *     "camera": { "position": [x,y,z], "direction": [x,y,z],
 *                 "screenDistance": d, "screenWidth": w, "screenHeight": h,
 *                 "screenColumns": n, "screenRows": m, "worldUp": [x,y,z] },
 *     "ambientLight": [r,g,b],
 *     "backgroundColour": [r,g,b],
 *     "lights": [ { "colour": [r,g,b], "pos": [x,y,z] } ],
 *     "objects": [ { "material": { "colour": [r,g,b], "kAmbient": a, "kDiffuse": d,
 *                                  "kSpecular": s, "kReflect": r, "shine": p },
 *                    "shape": { "type": "sphere", "centre": [x,y,z], "radius": r } } ]
 *   }
 *
 * "worldUp", "backgroundColour" and "kReflect" are optional. Plane shapes use
 * { "type": "plane", "point": [x,y,z], "normal": [x,y,z] }.
 * The parsed scene is validated before it is returned.
 */
core::Result<Scene> ParseScene(const std::string& text);

core::Result<Scene> LoadSceneFromFile(const std::filesystem::path& path);

} // namespace prism
