// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Motion-template cache: the per-heading successor moves of the grid
// lattice. Every template is a one-cell step into the 8-neighbourhood that
// ends with a (possibly different) discrete heading, driven forward or in
// reverse.

#pragma once

#include <array>
#include <vector>

#include "gridpilot/core/heading.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot::planners {

// ── Motion Template ──────────────────────────────────────────────────────────
struct MotionTemplate {
    Vec2i offset{0, 0};                 // Cell step, each axis in {-1, 0, 1}
    HeadingIncrement targetHeading{0};  // Heading after the step
    bool reverse{false};                // Step driven backwards
};

/// Successor moves for every heading, built once for (maxIncrements, arc).
///
/// Forward moves turn by up to `arc` increments and step along the new
/// heading. Reverse moves turn by up to 2 * arc increments and step against
/// the new heading. A forward move that keeps its heading is only allowed on
/// one of the eight cardinal headings, so oblique headings never drift off
/// their line by silently skipping cells. Immutable after construction.
class MotionTemplateCache {
public:
    /// Throws std::invalid_argument if maxIncrements < 1, arc < 0 or
    /// 2 * arc >= maxIncrements; std::logic_error if a zero step is produced.
    MotionTemplateCache(int max_increments, int arc);

    /// Moves available from `heading`. Throws std::out_of_range for a heading
    /// outside [0, maxIncrements).
    [[nodiscard]] const std::vector<MotionTemplate>& templatesFor(HeadingIncrement heading) const;

    /// Heading closest to each of the 8 compass directions, in the order
    /// +y, +x, -y, -x, (+x,+y), (+x,-y), (-x,+y), (-x,-y).
    [[nodiscard]] const std::array<HeadingIncrement, 8>& cardinalHeadings() const noexcept {
        return cardinal_;
    }
    [[nodiscard]] bool isCardinal(HeadingIncrement heading) const noexcept;

    [[nodiscard]] int maxIncrements() const noexcept { return max_increments_; }
    [[nodiscard]] int arc() const noexcept { return arc_; }

    /// Total templates over all headings
    [[nodiscard]] std::size_t size() const noexcept;

private:
    int max_increments_;
    int arc_;
    std::array<HeadingIncrement, 8> cardinal_{};
    std::vector<std::vector<MotionTemplate>> templates_;

    void computeCardinalHeadings();
    [[nodiscard]] std::vector<MotionTemplate> generate(HeadingIncrement heading) const;
    [[nodiscard]] MotionTemplate makeTemplate(HeadingIncrement target, bool reverse) const;
};

}  // namespace gridpilot::planners
