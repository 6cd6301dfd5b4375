// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// C++20 concepts for the seams of the planner: search states, occupancy
// providers and footprint providers. Checked at compile time, no vtables.

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>

#include "gridpilot/core/heading.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot {

// ═════════════════════════════════════════════════════════════════════════════
// SearchState Concept
// ═════════════════════════════════════════════════════════════════════════════
// Anything the generic best-first search can key its bookkeeping on.

template <typename S, typename Hash>
concept SearchState = std::equality_comparable<S> &&
                      std::copy_constructible<S> &&
                      std::is_copy_assignable_v<S> &&
                      requires(const Hash& hash, const S& s) {
    { hash(s) } -> std::convertible_to<std::size_t>;
};

// ═════════════════════════════════════════════════════════════════════════════
// OccupancyMap Concept
// ═════════════════════════════════════════════════════════════════════════════
// Read-only occupancy provider. Out-of-range cells must report blocked.

template <typename M>
concept OccupancyMap = requires(const M& map, int x, int y) {
    { map.isBlocked(x, y) } -> std::convertible_to<bool>;
    { map.width() } -> std::convertible_to<int>;
    { map.height() } -> std::convertible_to<int>;
};

// ═════════════════════════════════════════════════════════════════════════════
// FootprintSource Concept
// ═════════════════════════════════════════════════════════════════════════════
// Per-heading list of cell offsets covered by the agent body.

template <typename F>
concept FootprintSource = requires(const F& source, HeadingIncrement h) {
    { source.rotationFootprint(h) };
    { source.maxIncrements() } -> std::convertible_to<int>;
};

}  // namespace gridpilot
