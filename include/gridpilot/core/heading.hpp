// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Discrete heading arithmetic. A full turn is split into `maxIncrements`
// equal steps; increment i points at angle i * 2π / maxIncrements, measured
// counter-clockwise from the +x axis.

#pragma once

#include <cmath>
#include <cstdlib>

#include "gridpilot/core/types.hpp"

namespace gridpilot {

using HeadingIncrement = int;

/// Map any integer heading into [0, maxIncrements).
[[nodiscard]] constexpr HeadingIncrement wrapHeading(
    HeadingIncrement h, int maxIncrements) noexcept {
    return ((h % maxIncrements) + maxIncrements) % maxIncrements;
}

/// Shortest signed rotation from `from` to `to`, in increments.
/// Result lies in (-maxIncrements/2, maxIncrements/2]; a half turn is positive.
[[nodiscard]] constexpr int headingDelta(
    HeadingIncrement from, HeadingIncrement to, int maxIncrements) noexcept {
    int d = wrapHeading(to - from, maxIncrements);
    return (2 * d > maxIncrements) ? d - maxIncrements : d;
}

/// Unsigned size of the shortest rotation between two headings, in increments.
[[nodiscard]] constexpr int headingDistance(
    HeadingIncrement a, HeadingIncrement b, int maxIncrements) noexcept {
    int d = headingDelta(a, b, maxIncrements);
    return d < 0 ? -d : d;
}

[[nodiscard]] constexpr bool isValidHeading(
    HeadingIncrement h, int maxIncrements) noexcept {
    return h >= 0 && h < maxIncrements;
}

/// Angle of a heading increment in radians, in [0, 2π).
[[nodiscard]] inline Scalar headingToAngle(HeadingIncrement h, int maxIncrements) noexcept {
    return static_cast<Scalar>(wrapHeading(h, maxIncrements)) * constants::kTwoPi /
           static_cast<Scalar>(maxIncrements);
}

/// Unit direction vector of a heading.
[[nodiscard]] inline Vec2 headingDirection(HeadingIncrement h, int maxIncrements) noexcept {
    Scalar a = headingToAngle(h, maxIncrements);
    return {std::cos(a), std::sin(a)};
}

/// 8-neighbourhood step closest to a direction: each axis rounded, then
/// clamped to {-1, 0, 1}.
[[nodiscard]] inline Vec2i neighbourStep(const Vec2& direction) noexcept {
    auto snap = [](Scalar v) {
        int r = static_cast<int>(std::lround(v));
        return r < -1 ? -1 : (r > 1 ? 1 : r);
    };
    return {snap(direction.x()), snap(direction.y())};
}

}  // namespace gridpilot
