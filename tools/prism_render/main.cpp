// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>

#include "prism/core/config.h"
#include "prism/core/log.h"
#include "prism/scene/scene_loader.h"
#include "prism/tracer/png_writer.h"
#include "prism/tracer/renderer.h"

/**
 * prism_render - renders a JSON scene description to a PNG image
 */
int main(int argc, char** argv) {
    CLI::App app{"prism_render - ray trace a scene to PNG"};

    std::filesystem::path scenePath;
    std::filesystem::path outputPath = "output.png";
    std::filesystem::path configPath = "data/config/prism.json";
    std::optional<unsigned> threads;
    std::optional<int> maxBounces;
    std::optional<std::string> logLevel;

    app.add_option("--scene", scenePath, "Path to the scene file (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", outputPath, "Output PNG path")
        ->capture_default_str();
    app.add_option("--config", configPath, "Render configuration (JSON), defaults apply if absent")
        ->capture_default_str();
    app.add_option("--threads", threads, "Worker threads, 0 = all cores")
        ->check(CLI::Range(0u, prism::tracer::kMaxThreads));
    app.add_option("--max-bounces", maxBounces, "Reflection bounce ceiling")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error, critical");

    CLI11_PARSE(app, argc, argv);

    auto config = prism::config::load_from_file(configPath);
    if (threads) {
        config.render.threads = *threads;
    }
    if (maxBounces) {
        config.render.max_bounces = *maxBounces;
    }
    if (logLevel) {
        config.log_level = prism::log::parse_level(*logLevel);
    }

    prism::log::init(config.log_level);

    try {
        auto scene = prism::LoadSceneFromFile(scenePath);
        if (!scene) {
            PRISM_LOG_CRITICAL("{}", scene.GetError().Message);
            return EXIT_FAILURE;
        }

        PRISM_LOG_DEBUG("max bounces {}, shadow epsilon {}, reflection epsilon {}",
            config.render.max_bounces, config.render.shadow_epsilon, config.render.reflection_epsilon);

        const auto image = prism::tracer::Render(scene.Value(), config.render);

        auto written = prism::tracer::WritePng(image, outputPath);
        if (!written) {
            PRISM_LOG_CRITICAL("{}", written.GetError().Message);
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        PRISM_LOG_CRITICAL("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
