// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "prism/scene/scene.h"
#include "prism/tracer/image.h"
#include "prism/tracer/settings.h"

namespace prism::tracer {

/**
 * Renders every pixel of the scene's screen into a display-encoded image.
 *
 * Rows are traced in parallel on settings.threads workers. Pixels are
 * independent, so the output does not depend on the thread count or order.
 * Throws SceneError if the camera basis is degenerate.
 */
Image Render(const Scene& scene, const RenderSettings& settings);

} // namespace prism::tracer
