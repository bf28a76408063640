// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <variant>

#include "prism/scene/math.h"
#include "prism/scene/ray.h"

namespace prism {

struct Sphere {
    Vec3 centre;
    double radius = 1.0;
};

// Infinite plane through `point`. The stored normal is used as-is for shading.
struct Plane {
    Vec3 point;
    Vec3 normal{0.0, 0.0, 1.0};
};

// New primitives are added here and in Intersect()
using Shape = std::variant<Sphere, Plane>;

// Transient result of a single ray cast
struct Intersection {
    double t = 0.0;
    Vec3 pos;
    // Unit normal at pos
    Vec3 normal;
};

/**
 * Nearest intersection of the ray with the shape beyond min_distance.
 *
 * A hit qualifies when t > min_distance; with min_distance == 0 a hit at
 * exactly t == 0 also qualifies.
 */
std::optional<Intersection> Intersect(const Shape& shape, const Ray& ray, double min_distance);

std::optional<Intersection> IntersectSphere(const Sphere& sphere, const Ray& ray, double min_distance);
std::optional<Intersection> IntersectPlane(const Plane& plane, const Ray& ray, double min_distance);

// "sphere" / "plane"
std::string_view ShapeName(const Shape& shape);

} // namespace prism
