// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Pose: the search state of the grid planner.

#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

#include "gridpilot/core/heading.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot {

/// Agent pose on the grid: anchor cell, discrete heading, and whether the
/// move that produced it was driven in reverse.
///
/// Equality and hashing use position and heading only. A forward arrival and
/// a reverse arrival at the same cell and heading are one search state.
struct Pose {
    Vec2i position{0, 0};
    HeadingIncrement heading{0};
    bool reverse{false};

    Pose() = default;
    Pose(Vec2i p, HeadingIncrement h, bool rev = false)
        : position(std::move(p)), heading(h), reverse(rev) {}
    Pose(int x, int y, HeadingIncrement h, bool rev = false)
        : position(x, y), heading(h), reverse(rev) {}

    [[nodiscard]] int x() const noexcept { return position.x(); }
    [[nodiscard]] int y() const noexcept { return position.y(); }

    friend bool operator==(const Pose& a, const Pose& b) noexcept {
        return a.position == b.position && a.heading == b.heading;
    }
    friend bool operator!=(const Pose& a, const Pose& b) noexcept {
        return !(a == b);
    }

    friend std::ostream& operator<<(std::ostream& os, const Pose& p) {
        return os << "(" << p.x() << ", " << p.y() << ", h" << p.heading
                  << (p.reverse ? ", rev)" : ")");
    }
};

namespace detail {
inline std::size_t hashCombine(std::size_t h, std::size_t k) noexcept {
    h ^= k + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (h << 6) + (h >> 2);
    return h;
}
}  // namespace detail

struct PoseHash {
    std::size_t operator()(const Pose& p) const noexcept {
        std::size_t h = std::hash<int>{}(p.position.x());
        h = detail::hashCombine(h, std::hash<int>{}(p.position.y()));
        return detail::hashCombine(h, std::hash<int>{}(p.heading));
    }
};

}  // namespace gridpilot
