// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace prism
{

/**
 * @brief Base exception class for prism errors
 */
class PrismError : public std::runtime_error
{
public:
    explicit PrismError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Scene invariant violations (degenerate camera, malformed geometry)
 */
class SceneError : public PrismError
{
public:
    explicit SceneError(const std::string& message) : PrismError("Scene error: " + message) {}
};

} // namespace prism
