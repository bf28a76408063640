// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "prism/core/time.h"

#include <utility>

#include "prism/core/log.h"

namespace prism::time
{

using namespace std::chrono;

Stopwatch::Stopwatch() : m_begin(Clock::now()) {}

double Stopwatch::elapsed_ms() const
{
    return duration_cast<duration<double, std::milli>>(Clock::now() - m_begin).count();
}

ScopedTimer::ScopedTimer(std::string label) : m_label(std::move(label)) {}

ScopedTimer::~ScopedTimer()
{
    PRISM_LOG_INFO("[timer] {} took {:.3f} ms", m_label, m_watch.elapsed_ms());
}

} // namespace prism::time
