// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/robots/agent.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "gridpilot/planners/grid_planner.hpp"

namespace gridpilot::robots {

namespace {

HeadingIncrement checkedHeading(HeadingIncrement heading, int max_increments) {
    if (!isValidHeading(heading, max_increments)) {
        throw std::out_of_range("Agent: heading " + std::to_string(heading) + " outside [0, " +
                                std::to_string(max_increments) + ")");
    }
    return heading;
}

}  // anonymous namespace

Agent::Agent(const collision::FootprintCache& footprints, Vec2i position,
             HeadingIncrement heading)
    : footprints_(footprints)
    , position_(std::move(position))
    , heading_(checkedHeading(heading, footprints.maxIncrements())) {}

void Agent::setHeading(HeadingIncrement heading) {
    heading_ = checkedHeading(heading, maxIncrements());
}

void Agent::turn(int delta) noexcept {
    heading_ = wrapHeading(heading_ + delta, maxIncrements());
}

void Agent::setPose(const Pose& pose) {
    setHeading(pose.heading);
    position_ = pose.position;
}

std::vector<Vec2i> Agent::currentFootprint() const {
    return footprints_.footprint(position_, heading_);
}

std::vector<Vec2i> Agent::footprintAt(const Vec2i& position, HeadingIncrement heading) const {
    return footprints_.footprint(position, heading);
}

std::optional<PlannedPath> Agent::planTo(const planners::GridPlanner& planner,
                                         const Vec2i& goal) const {
    return planner.findPath(position_, heading_, goal);
}

}  // namespace gridpilot::robots
