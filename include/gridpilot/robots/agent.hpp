// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Rectangular grid agent: the caller-side pose of the vehicle plus its
// (borrowed) footprint masks.

#pragma once

#include <optional>
#include <vector>

#include "gridpilot/collision/footprint.hpp"
#include "gridpilot/core/pose.hpp"
#include "gridpilot/core/result.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot::planners {
class GridPlanner;
}  // namespace gridpilot::planners

namespace gridpilot::robots {

/// Agent state as held by an application: where it is and which way it faces.
/// The footprint cache is borrowed and must outlive the agent.
class Agent {
public:
    /// Throws std::out_of_range if `heading` is not a valid increment.
    Agent(const collision::FootprintCache& footprints, Vec2i position,
          HeadingIncrement heading = 0);

    [[nodiscard]] const Vec2i& position() const noexcept { return position_; }
    [[nodiscard]] HeadingIncrement heading() const noexcept { return heading_; }
    [[nodiscard]] Pose pose() const { return {position_, heading_}; }
    [[nodiscard]] int maxIncrements() const noexcept { return footprints_.maxIncrements(); }
    [[nodiscard]] const collision::AgentGeometry& geometry() const noexcept {
        return footprints_.geometry();
    }

    void setPosition(const Vec2i& position) noexcept { position_ = position; }
    /// Throws std::out_of_range if `heading` is not a valid increment.
    void setHeading(HeadingIncrement heading);
    /// Rotate in place by `delta` increments (either sign, wraps around).
    void turn(int delta) noexcept;
    /// Jump to a pose, e.g. one taken from a planned path.
    void setPose(const Pose& pose);

    /// Heading in radians
    [[nodiscard]] Scalar angle() const noexcept { return headingToAngle(heading_, maxIncrements()); }

    /// Cells covered at the current pose
    [[nodiscard]] std::vector<Vec2i> currentFootprint() const;
    /// Cells that would be covered at another pose
    [[nodiscard]] std::vector<Vec2i> footprintAt(const Vec2i& position,
                                                 HeadingIncrement heading) const;

    /// Plan from the current pose to `goal`.
    [[nodiscard]] std::optional<PlannedPath> planTo(const planners::GridPlanner& planner,
                                                    const Vec2i& goal) const;

private:
    const collision::FootprintCache& footprints_;
    Vec2i position_;
    HeadingIncrement heading_;
};

}  // namespace gridpilot::robots
