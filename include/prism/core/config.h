// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "prism/tracer/settings.h"

namespace prism::config {

struct RenderConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    tracer::RenderSettings render;
};

// Missing file yields defaults; a malformed file is logged and yields defaults.
RenderConfig load_from_file(const std::filesystem::path& path);

// Same as load_from_file, reading from an in-memory JSON document
RenderConfig load_from_string(const std::string& text);

} // namespace prism::config
