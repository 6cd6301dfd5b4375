// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Grid planner: best-first search over (cell, heading) poses for a
// rectangular agent, expanding precomputed motion templates and rejecting any
// pose whose footprint touches a blocked cell.

#pragma once

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "gridpilot/collision/footprint.hpp"
#include "gridpilot/collision/occupancy_grid.hpp"
#include "gridpilot/core/pose.hpp"
#include "gridpilot/core/result.hpp"
#include "gridpilot/core/types.hpp"
#include "gridpilot/planners/cost_model.hpp"
#include "gridpilot/planners/motion_templates.hpp"

namespace gridpilot::planners {

/// Collision-aware path search for a rectangular, heading-constrained agent.
///
/// The planner only borrows its collaborators. The grid, both caches and the
/// cost model must outlive it, and the grid must not change while a query
/// is running. The caches are never modified, so any number of planners may
/// share them.
class GridPlanner {
public:
    /// Throws std::invalid_argument if the caches or cost model disagree on
    /// maxIncrements.
    GridPlanner(const collision::OccupancyGrid& grid,
                const collision::FootprintCache& footprints,
                const MotionTemplateCache& templates,
                const CostModel& cost_model);

    /// Find a path for the agent anchored at `start` with `start_heading` to
    /// any pose anchored at `goal`. Returns std::nullopt when no path exists.
    /// Throws std::out_of_range for a heading outside [0, maxIncrements).
    [[nodiscard]] std::optional<PlannedPath> findPath(const Vec2i& start,
                                                      HeadingIncrement start_heading,
                                                      const Vec2i& goal,
                                                      SearchStats* stats = nullptr) const;

    /// Same search, reported with status and timing instead of exceptions.
    [[nodiscard]] PlanningResult solve(const PathQuery& query) const;

    /// Collision-free successors of `pose` and their edge costs.
    [[nodiscard]] std::vector<std::pair<Pose, Cost>> successors(const Pose& pose) const;

    /// True if the footprint of `pose` covers only free cells.
    [[nodiscard]] bool isPoseFree(const Pose& pose) const;

    /// Upper bound on distinct search states: width * height * maxIncrements.
    [[nodiscard]] std::size_t stateCapacity() const noexcept;

    [[nodiscard]] std::string_view name() const noexcept { return "GridLattice"; }
    [[nodiscard]] int maxIncrements() const noexcept { return templates_.maxIncrements(); }

private:
    const collision::OccupancyGrid& grid_;
    const collision::FootprintCache& footprints_;
    const MotionTemplateCache& templates_;
    const CostModel& cost_model_;
};

}  // namespace gridpilot::planners
