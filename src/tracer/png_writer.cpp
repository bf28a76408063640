// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/tracer/png_writer.h"

#include <fmt/format.h>

#include "prism/core/log.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace prism::tracer {

core::Result<void> WritePng(const Image& image, const std::filesystem::path& path) {
    if (image.Width() == 0 || image.Height() == 0) {
        return core::Result<void>::Err("cannot write an empty image");
    }

    const int width = static_cast<int>(image.Width());
    const int height = static_cast<int>(image.Height());
    const int stride = width * 3;

    const int ok = stbi_write_png(path.string().c_str(), width, height, 3, image.Data(), stride);
    if (ok == 0) {
        return core::Result<void>::Err(fmt::format("Failed to write PNG: {}", path.string()));
    }

    PRISM_LOG_INFO("wrote {}x{} image to {}", width, height, path.string());
    return core::Result<void>::Ok();
}

} // namespace prism::tracer
