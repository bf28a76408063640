// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "prism/core/common.h"
#include "prism/scene/math.h"
#include "prism/scene/ray.h"

namespace prism {

inline const Vec3 kDefaultWorldUp{0.0, 0.0, 1.0};

// Pinhole camera looking through a flat screen placed screen_distance along direction.
struct Camera {
    Vec3 position{0.0};
    // Need not be normalized
    Vec3 direction{0.0, 1.0, 0.0};
    double screen_distance = 1.0;
    double screen_width = 1.0;
    double screen_height = 1.0;
    u32 screen_columns = 0;
    u32 screen_rows = 0;
    // Must not be parallel to direction
    Vec3 world_up = kDefaultWorldUp;
};

// View basis: u along the view direction, v to the right, w up on screen
struct CameraBasis {
    Vec3 u;
    Vec3 v;
    Vec3 w;
};

/**
 * Maps pixel coordinates to primary rays.
 *
 * The basis is built once at construction. Throws SceneError when the camera
 * direction is zero or parallel to world_up, since no basis exists then.
 */
class CameraRays {
public:
    explicit CameraRays(const Camera& camera);

    static CameraBasis BuildBasis(const Vec3& direction, const Vec3& world_up);

    // Pure function of the camera and (x, y); row 0 is the top of the image
    Ray RayForPixel(u32 x, u32 y) const;

private:
    Camera camera_;
    CameraBasis basis_;
};

} // namespace prism
