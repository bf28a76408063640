// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace prism::time {

using Clock = std::chrono::steady_clock;

/// Measures wall time since construction or the last reset
class Stopwatch {
public:
    Stopwatch();

    double elapsed_ms() const;

private:
    Clock::time_point m_begin;
};

/// Logs the elapsed time of a scope on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

private:
    std::string m_label;
    Stopwatch m_watch;
};

} // namespace prism::time
