// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Edge cost and heuristic for the grid lattice.
//
// Turning is priced by the speed an agent cruising at `referenceSpeed` would
// lose to take the turn safely: the maximum cornering speed for a turn of
// angle θ is sqrt(friction * gravity / θ), capped at the reference speed, and
// the lost fraction of the reference speed is scaled by `angleWeight`.
// Distance is priced by squared step length. Reverse steps multiply the sum.

#pragma once

#include <optional>
#include <vector>

#include "gridpilot/core/pose.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot::planners {

// ── Parameters ───────────────────────────────────────────────────────────────
struct CostParams {
    Scalar referenceSpeed{static_cast<Scalar>(5.0)};   // Cruise speed (m/s)
    Scalar friction{static_cast<Scalar>(0.7)};         // Tyre-ground friction coefficient
    Scalar gravity{static_cast<Scalar>(9.81)};         // m/s^2

    Cost angleWeight{1000};       // Cost of losing the full reference speed
    Cost distanceWeight{1000};    // Cost per squared cell of travel
    Cost heuristicWeight{10};     // Heuristic cost per squared cell to the goal
    Cost reverseMultiplier{5};    // Applied to reverse steps
};

/// Speed-loss cost model. Immutable after construction; the turning penalty
/// is tabulated for every heading difference.
class CostModel {
public:
    /// Throws std::invalid_argument for non-positive physical constants,
    /// a zero distance weight or a reverse multiplier below 1.
    CostModel(int max_increments, CostParams params = {});

    /// Cost of stepping from `from` to `to`. Zero when `from` is empty
    /// (the start state).
    [[nodiscard]] Cost cost(const Pose& to, const std::optional<Pose>& from) const;

    /// Squared-distance estimate of the cost remaining from `pose` to `goal`.
    [[nodiscard]] Cost heuristic(const Pose& pose, const Vec2i& goal) const noexcept;

    /// Position equality only; heading and direction are irrelevant.
    [[nodiscard]] static bool isGoal(const Pose& pose, const Vec2i& goal) noexcept {
        return pose.position == goal;
    }

    /// Fraction of the reference speed lost to a turn of `turn_angle` radians,
    /// in [0, 1].
    [[nodiscard]] Scalar speedLossFraction(Scalar turn_angle) const noexcept;

    /// Tabulated angle cost for a turn of `increments` heading steps.
    [[nodiscard]] Cost turnCost(int increments) const noexcept;

    /// Chebyshev distance (cells) up to which heuristic() never exceeds the
    /// true remaining cost. Every step moves at most one cell per axis and
    /// costs at least distanceWeight, while the heuristic is at most
    /// 2 * heuristicWeight * d^2 for Chebyshev distance d.
    [[nodiscard]] int admissibleRange() const noexcept;

    [[nodiscard]] const CostParams& params() const noexcept { return params_; }
    [[nodiscard]] int maxIncrements() const noexcept { return max_increments_; }

private:
    int max_increments_;
    CostParams params_;
    std::vector<Cost> turn_costs_;   // Indexed by |heading difference|
};

}  // namespace gridpilot::planners
