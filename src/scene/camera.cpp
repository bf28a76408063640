// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/scene/camera.h"

#include <fmt/format.h>

#include "prism/core/error.h"

namespace prism {

CameraBasis CameraRays::BuildBasis(const Vec3& direction, const Vec3& world_up) {
    const auto u = TryNormalize(direction);
    if (!u) {
        throw SceneError("camera direction has zero length");
    }

    const Vec3 v = glm::cross(*u, world_up);
    if (glm::dot(v, v) == 0.0) {
        throw SceneError(fmt::format("camera direction ({}, {}, {}) is parallel to world up ({}, {}, {})",
            direction.x, direction.y, direction.z, world_up.x, world_up.y, world_up.z));
    }

    const Vec3 w = glm::cross(v, *u);
    return CameraBasis{*u, v, w};
}

CameraRays::CameraRays(const Camera& camera)
    : camera_(camera), basis_(BuildBasis(camera.direction, camera.world_up)) {
}

Ray CameraRays::RayForPixel(u32 x, u32 y) const {
    const auto columns = static_cast<i64>(camera_.screen_columns);
    const auto rows = static_cast<i64>(camera_.screen_rows);

    // Integer halving keeps the centre pixel of an odd grid on the optical axis
    const double x_screen = static_cast<double>(static_cast<i64>(x) - columns / 2)
        / static_cast<double>(columns) * camera_.screen_width * 0.5;
    const double y_screen = static_cast<double>(static_cast<i64>(y) - rows / 2)
        / static_cast<double>(rows) * camera_.screen_height * -0.5;

    return Ray{
        camera_.position,
        camera_.screen_distance * basis_.u + x_screen * basis_.v + y_screen * basis_.w
    };
}

} // namespace prism
