// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/tracer/tracer.h"

#include "prism/tracer/shading.h"

namespace prism::tracer {

Tracer::Tracer(const Scene& scene, const RenderSettings& settings)
    : scene_(scene), settings_(settings), cameraRays_(scene.camera) {
}

Colour Tracer::Trace(const Ray& ray, double min_distance, int depth) const {
    const auto hit = scene_.Intersect(ray, min_distance);
    if (!hit) {
        return scene_.background_colour;
    }

    Colour colour = Shade(scene_, settings_, ray, *hit);

    const double k_reflect = hit->material.k_reflect;
    if (k_reflect != 0.0 && depth < settings_.max_bounces) {
        const Ray reflected{hit->intersection.pos, Reflect(ray.direction, hit->intersection.normal)};
        colour += k_reflect * Trace(reflected, settings_.reflection_epsilon, depth + 1);
    }

    return colour;
}

Colour Tracer::TracePixel(u32 x, u32 y) const {
    return Trace(cameraRays_.RayForPixel(x, y), 0.0, 0);
}

} // namespace prism::tracer
