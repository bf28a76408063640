// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/tracer/image.h"

#include <cmath>

namespace prism::tracer {

static_assert(sizeof(Rgb8) == 3, "Rgb8 must be tightly packed for image encoders");

u8 EncodeChannel(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    const double scaled = std::round(value * 255.0);
    if (scaled <= 0.0) return 0;
    if (scaled >= 255.0) return 255;
    return static_cast<u8>(scaled);
}

Rgb8 EncodeColour(const Colour& colour) {
    return Rgb8{EncodeChannel(colour.r), EncodeChannel(colour.g), EncodeChannel(colour.b)};
}

Image::Image(u32 width, u32 height)
    : width_(width), height_(height), pixels_(static_cast<usize>(width) * height) {
}

const u8* Image::Data() const {
    return reinterpret_cast<const u8*>(pixels_.data());
}

} // namespace prism::tracer
