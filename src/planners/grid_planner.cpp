// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/planners/grid_planner.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "gridpilot/core/logging.hpp"
#include "gridpilot/search/best_first.hpp"

namespace gridpilot::planners {

GridPlanner::GridPlanner(const collision::OccupancyGrid& grid,
                         const collision::FootprintCache& footprints,
                         const MotionTemplateCache& templates,
                         const CostModel& cost_model)
    : grid_(grid), footprints_(footprints), templates_(templates), cost_model_(cost_model) {
    const int n = templates_.maxIncrements();
    if (footprints_.maxIncrements() != n || cost_model_.maxIncrements() != n) {
        throw std::invalid_argument(
            "GridPlanner: heading resolution mismatch (templates " + std::to_string(n) +
            ", footprints " + std::to_string(footprints_.maxIncrements()) +
            ", cost model " + std::to_string(cost_model_.maxIncrements()) + ")");
    }
}

bool GridPlanner::isPoseFree(const Pose& pose) const {
    return grid_.isFootprintFree(pose.position, footprints_.rotationFootprint(pose.heading));
}

std::size_t GridPlanner::stateCapacity() const noexcept {
    return static_cast<std::size_t>(grid_.width()) * static_cast<std::size_t>(grid_.height()) *
           static_cast<std::size_t>(templates_.maxIncrements());
}

std::vector<std::pair<Pose, Cost>> GridPlanner::successors(const Pose& pose) const {
    const auto& moves = templates_.templatesFor(pose.heading);
    std::vector<std::pair<Pose, Cost>> out;
    out.reserve(moves.size());

    for (const auto& move : moves) {
        Pose next(pose.position + move.offset, move.targetHeading, move.reverse);
        if (!isPoseFree(next)) continue;
        out.emplace_back(next, cost_model_.cost(next, pose));
    }
    return out;
}

std::optional<PlannedPath> GridPlanner::findPath(const Vec2i& start,
                                                 HeadingIncrement start_heading,
                                                 const Vec2i& goal,
                                                 SearchStats* stats) const {
    if (!isValidHeading(start_heading, templates_.maxIncrements())) {
        throw std::out_of_range("GridPlanner: start heading " + std::to_string(start_heading) +
                                " outside [0, " + std::to_string(templates_.maxIncrements()) + ")");
    }

    if (stats) *stats = SearchStats{};

    // The anchor cell is part of every footprint, so a blocked or off-grid
    // goal cell can never be reached
    if (grid_.isBlocked(goal)) {
        log::get()->debug("Goal ({}, {}) is blocked or outside the grid", goal.x(), goal.y());
        return std::nullopt;
    }

    if (chebyshevDistance(start, goal) > cost_model_.admissibleRange()) {
        log::get()->warn("Goal ({}, {}) lies beyond the heuristic's admissible range of {} cells; "
                         "the returned path may not be the cheapest",
                         goal.x(), goal.y(), cost_model_.admissibleRange());
    }

    const Pose start_pose(start, start_heading);
    auto result = search::bestFirstSearch<Pose, PoseHash>(
        start_pose, stateCapacity(),
        [this](const Pose& p) { return successors(p); },
        [this, &goal](const Pose& p) { return cost_model_.heuristic(p, goal); },
        [&goal](const Pose& p) { return CostModel::isGoal(p, goal); },
        stats);

    if (!result) return std::nullopt;

    PlannedPath path;
    path.poses = std::move(result->path);
    path.cost = result->cost;
    return path;
}

PlanningResult GridPlanner::solve(const PathQuery& query) const {
    PlanningResult result;
    result.plannerName = std::string(name());
    auto start_time = Clock::now();

    if (!isValidHeading(query.startHeading, templates_.maxIncrements())) {
        result.status = SearchStatus::kInvalidQuery;
        result.message = "start heading " + std::to_string(query.startHeading) +
                         " outside [0, " + std::to_string(templates_.maxIncrements()) + ")";
        return result;
    }

    auto path = findPath(query.start, query.startHeading, query.goal, &result.stats);

    result.solveTimeMs = std::chrono::duration<double, std::milli>(
        Clock::now() - start_time).count();

    if (path) {
        result.status = SearchStatus::kSuccess;
        result.path = std::move(*path);
    } else {
        result.status = SearchStatus::kNoPath;
    }

    log::get()->debug("{}: ({}, {}, h{}) -> ({}, {}) {} in {:.3f} ms, {} expansions, cost {}",
                      name(), query.start.x(), query.start.y(), query.startHeading,
                      query.goal.x(), query.goal.y(), toString(result.status),
                      result.solveTimeMs, result.stats.expansions, result.path.cost);
    return result;
}

}  // namespace gridpilot::planners
