// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/scene/scene.h"

#include <fmt/format.h>

#include "prism/core/common.h"
#include "prism/core/error.h"

namespace prism {

std::optional<Hit> Scene::Intersect(const Ray& ray, double min_distance) const {
    std::optional<Hit> nearest;
    for (const auto& object : objects) {
        auto intersection = prism::Intersect(object.shape, ray, min_distance);
        if (intersection && (!nearest || intersection->t < nearest->intersection.t)) {
            nearest = Hit{*intersection, object.material};
        }
    }
    return nearest;
}

bool Scene::Occluded(const Ray& ray, double min_distance) const {
    for (const auto& object : objects) {
        if (prism::Intersect(object.shape, ray, min_distance)) {
            return true;
        }
    }
    return false;
}

core::Result<void> ValidateScene(const Scene& scene) {
    const auto& camera = scene.camera;
    ENSURE(camera.screen_columns > 0 && camera.screen_rows > 0,
           fmt::format("screen must have at least one pixel, got {}x{}",
                       camera.screen_columns, camera.screen_rows));
    ENSURE(camera.screen_distance > 0.0, "screen distance must be positive");
    ENSURE(camera.screen_width > 0.0 && camera.screen_height > 0.0,
           "screen width and height must be positive");

    try {
        CameraRays::BuildBasis(camera.direction, camera.world_up);
    } catch (const SceneError& err) {
        return core::MakeError(err.what());
    }

    for (usize i = 0; i < scene.objects.size(); ++i) {
        const auto& object = scene.objects[i];
        ENSURE(object.material.shine >= 0.0,
               fmt::format("object {}: shine must not be negative", i));

        if (const auto* sphere = std::get_if<Sphere>(&object.shape)) {
            ENSURE(sphere->radius > 0.0,
                   fmt::format("object {}: sphere radius must be positive", i));
        } else if (const auto* plane = std::get_if<Plane>(&object.shape)) {
            ENSURE(TryNormalize(plane->normal).has_value(),
                   fmt::format("object {}: plane normal has zero length", i));
        }
    }

    return core::Result<void>::Ok();
}

} // namespace prism
