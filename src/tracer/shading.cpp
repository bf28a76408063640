// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/tracer/shading.h"

#include <cmath>

namespace prism::tracer {
namespace {

// Diffuse + specular from one light; light_direction is the unit vector toward it
Colour ShadeLight(const LightSource& light, const Vec3& light_direction, const Material& material,
                  const Intersection& intersection, const Vec3& view_origin) {
    const double lambert = Saturate(glm::dot(intersection.normal, light_direction));
    Colour result = material.k_diffuse * lambert * (light.colour * material.colour);

    // No view direction when the viewer is on the surface, no half vector when
    // light and view point in opposite directions; both drop the highlight.
    const auto view_direction = TryNormalize(view_origin - intersection.pos);
    if (!view_direction) {
        return result;
    }
    const auto half_vector = TryNormalize(light_direction + *view_direction);
    if (!half_vector) {
        return result;
    }

    const double highlight = std::pow(Saturate(glm::dot(*half_vector, intersection.normal)), material.shine);
    result += material.k_specular * highlight * light.colour;
    return result;
}

} // namespace

Colour Shade(const Scene& scene, const RenderSettings& settings, const Ray& ray, const Hit& hit) {
    const auto& material = hit.material;
    const auto& intersection = hit.intersection;

    Colour colour = material.k_ambient * (scene.ambient_light * material.colour);

    for (const auto& light : scene.lights) {
        const auto to_light = TryNormalize(light.pos - intersection.pos);
        if (!to_light) {
            // Light sits on the surface point
            continue;
        }

        // Unit direction so shadow_epsilon is measured in world units
        const Ray shadow_ray{intersection.pos, *to_light};
        if (scene.Occluded(shadow_ray, settings.shadow_epsilon)) {
            continue;
        }

        colour += ShadeLight(light, *to_light, material, intersection, ray.origin);
    }

    return colour;
}

} // namespace prism::tracer
