// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

namespace prism::tracer {

// Upper bound accepted for RenderSettings::threads from config and the command line
inline constexpr unsigned kMaxThreads = 1024;

// Tunables of the tracing pipeline. Shared read-only by every pixel task.
struct RenderSettings {
    // Reflection recursion stops once this many bounces have been taken
    int max_bounces = 10;
    // Minimum hit distance for shadow rays; trades acne against missed contact shadows
    double shadow_epsilon = 0.1;
    // Minimum hit distance for reflection rays
    double reflection_epsilon = 1e-4;
    // Worker count for the pixel renderer, 0 = hardware concurrency
    unsigned threads = 0;
};

} // namespace prism::tracer
