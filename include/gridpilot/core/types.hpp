// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Core type definitions for the GridPilot grid motion planning library.

#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <chrono>
#include <cstdint>
#include <limits>

namespace gridpilot {

// ─── Scalar Type ─────────────────────────────────────────────────────────────
#ifdef GRIDPILOT_SCALAR_FLOAT
using Scalar = float;
#else
using Scalar = double;
#endif

// ─── Common Eigen Types ─────────────────────────────────────────────────────
using Vec2  = Eigen::Matrix<Scalar, 2, 1>;
using Vec2i = Eigen::Matrix<int, 2, 1>;     // Grid cell coordinate / offset
using Rot2  = Eigen::Rotation2D<Scalar>;

// ─── Search Cost ─────────────────────────────────────────────────────────────
using Cost = std::uint32_t;

// ─── Time ────────────────────────────────────────────────────────────────────
using Clock = std::chrono::steady_clock;

// ─── Constants ───────────────────────────────────────────────────────────────
namespace constants {
    inline constexpr Scalar kPi        = static_cast<Scalar>(3.14159265358979323846);
    inline constexpr Scalar kTwoPi     = static_cast<Scalar>(2.0) * kPi;
    inline constexpr Scalar kEpsilon   = std::numeric_limits<Scalar>::epsilon();
    inline constexpr Scalar kInfinity  = std::numeric_limits<Scalar>::infinity();
}  // namespace constants

// ─── Utility Functions ───────────────────────────────────────────────────────

/// Clamp value to [lo, hi]
constexpr Scalar clamp(Scalar v, Scalar lo, Scalar hi) noexcept {
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

/// Squared Euclidean distance between two cells
[[nodiscard]] inline int squaredDistance(const Vec2i& a, const Vec2i& b) noexcept {
    return (b - a).squaredNorm();
}

/// Chebyshev (king-move) distance between two cells
[[nodiscard]] inline int chebyshevDistance(const Vec2i& a, const Vec2i& b) noexcept {
    return (b - a).cwiseAbs().maxCoeff();
}

}  // namespace gridpilot
