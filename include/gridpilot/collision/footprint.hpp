// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Agent footprint cache: grid cells covered by a rotated rectangular agent,
// precomputed once per discrete heading.

#pragma once

#include <vector>

#include "gridpilot/core/concepts.hpp"
#include "gridpilot/core/heading.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot::collision {

/// Rectangular agent body, in cell units. halfWidth runs along the heading
/// direction, halfHeight across it.
struct AgentGeometry {
    Scalar halfWidth{static_cast<Scalar>(0.25)};
    Scalar halfHeight{static_cast<Scalar>(0.25)};

    [[nodiscard]] Vec2 halfExtents() const noexcept { return {halfWidth, halfHeight}; }
    [[nodiscard]] static AgentGeometry fromSize(Scalar width, Scalar height) noexcept {
        return {width / 2, height / 2};
    }
};

/// Separating Axis Theorem test between a rotated rectangle and the unit cell
/// [cell.x, cell.x + 1] x [cell.y, cell.y + 1]. Candidate axes are the
/// rectangle's two face normals and the two grid axes. Projections that
/// overlap by less than `tolerance` count as separated, so cells that only
/// touch the rectangle's edge are not reported.
[[nodiscard]] bool rectangleOverlapsCell(const Vec2& center, const Vec2& half_extents,
                                         Scalar angle, const Vec2i& cell,
                                         Scalar tolerance = static_cast<Scalar>(1e-6));

/// Per-heading footprint masks for one agent geometry.
///
/// The rectangle pivots on the lattice point at the (+x, +y) corner of the
/// anchor cell. Agents no larger than one cell on either axis occupy only the
/// anchor cell {(0, 0)} at every heading. Immutable after construction.
class FootprintCache {
public:
    /// Throws std::invalid_argument for non-positive extents or maxIncrements < 1.
    FootprintCache(AgentGeometry geometry, int max_increments);

    /// Offsets relative to the anchor cell, x-major then y.
    /// Throws std::out_of_range for a heading outside [0, maxIncrements).
    [[nodiscard]] const std::vector<Vec2i>& rotationFootprint(HeadingIncrement heading) const;

    /// Absolute cells covered with the anchor at `position`.
    [[nodiscard]] std::vector<Vec2i> footprint(const Vec2i& position,
                                               HeadingIncrement heading) const;

    [[nodiscard]] int maxIncrements() const noexcept { return max_increments_; }
    [[nodiscard]] const AgentGeometry& geometry() const noexcept { return geometry_; }

    /// Largest mask over all headings.
    [[nodiscard]] std::size_t maxFootprintSize() const noexcept;

    /// Pivot of the rectangle in the anchor cell's frame.
    [[nodiscard]] static Vec2 pivot() noexcept { return {1, 1}; }

private:
    AgentGeometry geometry_;
    int max_increments_;
    bool single_cell_{false};
    std::vector<std::vector<Vec2i>> masks_;

    [[nodiscard]] std::vector<Vec2i> buildMask(HeadingIncrement heading) const;
};

static_assert(FootprintSource<FootprintCache>);

}  // namespace gridpilot::collision
