// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "prism/scene/scene.h"
#include "prism/tracer/settings.h"

namespace prism::tracer {

/**
 * Local illumination at a hit: ambient plus, for every light not blocked by a
 * shadow ray, Lambert diffuse and Blinn-Phong specular.
 *
 * The result is linear RGB and may exceed 1. The viewer is ray.origin, which
 * makes the same code correct for primary and reflected rays.
 */
Colour Shade(const Scene& scene, const RenderSettings& settings, const Ray& ray, const Hit& hit);

} // namespace prism::tracer
