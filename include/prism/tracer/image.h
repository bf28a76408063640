// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <vector>

#include "prism/core/common.h"
#include "prism/scene/math.h"

namespace prism::tracer {

struct Rgb8 {
    u8 r = 0;
    u8 g = 0;
    u8 b = 0;

    bool operator==(const Rgb8& other) const = default;
};

// Linear channel to 8 bits: clamp(round(value * 255), 0, 255). Non-finite values map to 0.
u8 EncodeChannel(double value);
Rgb8 EncodeColour(const Colour& colour);

// Display-encoded RGB grid addressed by (column, row), row 0 at the top
class Image {
public:
    Image() = default;
    Image(u32 width, u32 height);

    u32 Width() const { return width_; }
    u32 Height() const { return height_; }

    Rgb8& At(u32 x, u32 y) { return pixels_[Index(x, y)]; }
    const Rgb8& At(u32 x, u32 y) const { return pixels_[Index(x, y)]; }

    // Tightly packed RGB bytes, row-major
    const u8* Data() const;

    bool operator==(const Image& other) const = default;

private:
    usize Index(u32 x, u32 y) const { return static_cast<usize>(y) * width_ + x; }

    u32 width_ = 0;
    u32 height_ = 0;
    std::vector<Rgb8> pixels_;
};

} // namespace prism::tracer
