// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/tracer/renderer.h"

#include <future>
#include <vector>

#include <fmt/format.h>

#include "prism/core/log.h"
#include "prism/core/thread_pool.h"
#include "prism/core/time.h"
#include "prism/tracer/tracer.h"

namespace prism::tracer {

Image Render(const Scene& scene, const RenderSettings& settings) {
    const Tracer tracer(scene, settings);

    const u32 columns = scene.camera.screen_columns;
    const u32 rows = scene.camera.screen_rows;
    Image image(columns, rows);

    time::ScopedTimer timer(fmt::format("render {}x{}", columns, rows));

    core::ThreadPool pool(settings.threads);
    PRISM_LOG_INFO("rendering {}x{} pixels, {} objects, {} lights on {} threads",
        columns, rows, scene.objects.size(), scene.lights.size(), pool.ThreadCount());

    // One task per row; each row writes only its own pixels
    std::vector<std::future<void>> pending;
    pending.reserve(rows);
    for (u32 y = 0; y < rows; ++y) {
        pending.push_back(pool.Submit([&tracer, &image, columns, y] {
            for (u32 x = 0; x < columns; ++x) {
                image.At(x, y) = EncodeColour(tracer.TracePixel(x, y));
            }
        }));
    }

    for (auto& row : pending) {
        row.get();
    }

    return image;
}

} // namespace prism::tracer
