// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>

#include "prism/core/result.h"
#include "prism/tracer/image.h"

namespace prism::tracer {

core::Result<void> WritePng(const Image& image, const std::filesystem::path& path);

} // namespace prism::tracer
