// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "prism/scene/math.h"

namespace prism {

// Phong-style surface description. Coefficients are expected in [0,1] but are not clamped.
struct Material {
    Colour colour{0.0};
    double k_ambient = 0.0;
    double k_diffuse = 0.0;
    double k_specular = 0.0;
    double k_reflect = 0.0;
    // Specular exponent
    double shine = 0.0;
};

} // namespace prism
