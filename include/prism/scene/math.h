// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cmath>
#include <optional>

#include <glm/glm.hpp>

namespace prism {

using Vec3 = glm::dvec3;

// Colours share the vector type; products between them are component-wise
using Colour = glm::dvec3;

inline double Saturate(double x) {
    return glm::clamp(x, 0.0, 1.0);
}

/**
 * Mirror reflection of a direction about a surface normal.
 *
 * @param d Incoming direction, any length
 * @param n Unit surface normal
 * @return d - 2 (d . n) n
 */
inline Vec3 Reflect(const Vec3& d, const Vec3& n) {
    return glm::reflect(d, n);
}

/**
 * Normalizes v, or returns nothing when v has no usable direction
 * (zero or non-finite length).
 */
inline std::optional<Vec3> TryNormalize(const Vec3& v) {
    const double len = glm::length(v);
    if (len == 0.0 || !std::isfinite(len)) {
        return std::nullopt;
    }
    return v / len;
}

} // namespace prism
