// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/scene/shape.h"

#include <cmath>

#include "prism/core/common.h"

namespace prism {

namespace {

bool Qualifies(double t, double min_distance) {
    return t > min_distance || (min_distance == 0.0 && t == 0.0);
}

} // namespace

std::optional<Intersection> IntersectSphere(const Sphere& sphere, const Ray& ray, double min_distance) {
    const double a = glm::dot(ray.direction, ray.direction);
    if (a == 0.0) {
        return std::nullopt;
    }

    const Vec3 difference = ray.origin - sphere.centre;
    const double b = 2.0 * glm::dot(ray.direction, difference);
    const double c = glm::dot(difference, difference) - sphere.radius * sphere.radius;

    const double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0.0) {
        return std::nullopt;
    }

    const double root = std::sqrt(discriminant);
    // near <= far since a > 0
    const double near = (-b - root) / (2.0 * a);
    const double far = (-b + root) / (2.0 * a);

    double t;
    if (Qualifies(near, min_distance)) {
        t = near;
    } else if (Qualifies(far, min_distance)) {
        t = far;
    } else {
        return std::nullopt;
    }

    const Vec3 pos = ray.At(t);
    const auto normal = TryNormalize(pos - sphere.centre);
    if (!normal) {
        return std::nullopt;
    }
    return Intersection{t, pos, *normal};
}

std::optional<Intersection> IntersectPlane(const Plane& plane, const Ray& ray, double min_distance) {
    const double denom = glm::dot(plane.normal, ray.direction);
    if (denom == 0.0) {
        return std::nullopt;
    }

    const double t = glm::dot(plane.normal, plane.point - ray.origin) / denom;
    if (!Qualifies(t, min_distance)) {
        return std::nullopt;
    }

    const auto normal = TryNormalize(plane.normal);
    if (!normal) {
        return std::nullopt;
    }
    return Intersection{t, ray.At(t), *normal};
}

std::optional<Intersection> Intersect(const Shape& shape, const Ray& ray, double min_distance) {
    return std::visit(overloaded{
        [&](const Sphere& sphere) { return IntersectSphere(sphere, ray, min_distance); },
        [&](const Plane& plane) { return IntersectPlane(plane, ray, min_distance); }
    }, shape);
}

std::string_view ShapeName(const Shape& shape) {
    return std::visit(overloaded{
        [](const Sphere&) { return std::string_view("sphere"); },
        [](const Plane&) { return std::string_view("plane"); }
    }, shape);
}

} // namespace prism
