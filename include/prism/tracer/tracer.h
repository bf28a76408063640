// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "prism/core/common.h"
#include "prism/scene/camera.h"
#include "prism/scene/scene.h"
#include "prism/tracer/settings.h"

namespace prism::tracer {

/**
 * Recursive ray tracer over a read-only scene.
 *
 * Holds references only; the scene must outlive the tracer. All member
 * functions are const and safe to call from many threads at once.
 */
class Tracer {
public:
    // Throws SceneError if the camera basis is degenerate
    Tracer(const Scene& scene, const RenderSettings& settings);

    /**
     * Colour seen along a ray: background on a miss, otherwise local shading
     * plus k_reflect times the colour along the mirror direction.
     *
     * @param ray Ray to follow
     * @param min_distance Hits at or below this distance are ignored (0 for primary rays)
     * @param depth Bounces already taken; no reflection is added once it reaches max_bounces
     */
    Colour Trace(const Ray& ray, double min_distance, int depth) const;

    // Linear colour of pixel (x, y), row 0 at the top
    Colour TracePixel(u32 x, u32 y) const;

private:
    const Scene& scene_;
    RenderSettings settings_;
    CameraRays cameraRays_;
};

} // namespace prism::tracer
