// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "prism/scene/math.h"

namespace prism {

// Direction is not required to be unit length
struct Ray {
    Vec3 origin;
    Vec3 direction;

    Vec3 At(double t) const { return origin + t * direction; }
};

} // namespace prism
