// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/core/config.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "prism/core/log.h"

namespace prism::config {
namespace {

void apply_json(RenderConfig& config, const nlohmann::json& json) {
    if (auto logging = json.find("logging"); logging != json.end()) {
        if (logging->contains("level")) {
            config.log_level = log::parse_level((*logging)["level"].get<std::string>());
        }
    }

    if (auto render = json.find("render"); render != json.end()) {
        if (render->contains("threads")) {
            const auto threads = (*render)["threads"].get<long long>();
            if (threads < 0 || threads > static_cast<long long>(tracer::kMaxThreads)) {
                throw std::out_of_range(fmt::format("render.threads must be in [0, {}], got {}",
                                                    tracer::kMaxThreads, threads));
            }
            config.render.threads = static_cast<unsigned>(threads);
        }
        if (render->contains("maxBounces")) {
            config.render.max_bounces = (*render)["maxBounces"].get<int>();
        }
        if (render->contains("shadowEpsilon")) {
            config.render.shadow_epsilon = (*render)["shadowEpsilon"].get<double>();
        }
        if (render->contains("reflectionEpsilon")) {
            config.render.reflection_epsilon = (*render)["reflectionEpsilon"].get<double>();
        }
    }
}

} // namespace

RenderConfig load_from_string(const std::string& text) {
    RenderConfig config{};
    try {
        apply_json(config, nlohmann::json::parse(text));
    } catch (const std::exception& err) {
        PRISM_LOG_ERROR("Error parsing config: {}", err.what());
        return RenderConfig{};
    }
    return config;
}

RenderConfig load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return RenderConfig{}; // defaults
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        PRISM_LOG_ERROR("Failed to open config file: {}", path.string());
        return RenderConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_from_string(buffer.str());
}

} // namespace prism::config
