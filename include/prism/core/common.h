// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

// Common types
namespace prism
{

using u8 = uint8_t;
using u32 = uint32_t;

using i64 = int64_t;

using usize = size_t;

// Visitor helper for std::visit over closed variants
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace prism
