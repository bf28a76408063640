// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include "prism/core/result.h"
#include "prism/scene/camera.h"
#include "prism/scene/material.h"
#include "prism/scene/math.h"
#include "prism/scene/ray.h"
#include "prism/scene/shape.h"

namespace prism {

// Point light, no distance attenuation
struct LightSource {
    Colour colour{1.0};
    Vec3 pos{0.0};
};

struct SceneObject {
    Shape shape;
    Material material;
};

// Nearest hit of a ray together with the surface it landed on
struct Hit {
    Intersection intersection;
    Material material;
};

/**
 * Aggregate root of everything a render reads.
 *
 * Built once before rendering and only read afterwards, so it is shared
 * between pixel tasks without locking.
 */
struct Scene {
    Camera camera;
    Colour ambient_light{0.0};
    // Returned for rays that hit nothing
    Colour background_colour{0.0};
    std::vector<LightSource> lights;
    std::vector<SceneObject> objects;

    /**
     * Linear scan over all objects for the smallest qualifying t.
     * Ties keep the object listed first.
     */
    std::optional<Hit> Intersect(const Ray& ray, double min_distance) const;

    // True when anything at all lies along the ray beyond min_distance
    bool Occluded(const Ray& ray, double min_distance) const;
};

// Rejects scenes the tracer cannot render (degenerate camera, geometry or screen)
core::Result<void> ValidateScene(const Scene& scene);

} // namespace prism
