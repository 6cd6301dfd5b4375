// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/planners/cost_model.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "gridpilot/core/heading.hpp"

namespace gridpilot::planners {

CostModel::CostModel(int max_increments, CostParams params)
    : max_increments_(max_increments), params_(params) {
    if (max_increments_ < 1) {
        throw std::invalid_argument("CostModel: maxIncrements must be >= 1, got " +
                                    std::to_string(max_increments_));
    }
    if (!(params_.referenceSpeed > 0) || !(params_.friction > 0) || !(params_.gravity > 0)) {
        throw std::invalid_argument("CostModel: referenceSpeed, friction and gravity must be positive");
    }
    if (params_.distanceWeight == 0) {
        throw std::invalid_argument("CostModel: distanceWeight must be positive");
    }
    if (params_.reverseMultiplier < 1) {
        throw std::invalid_argument("CostModel: reverseMultiplier must be >= 1");
    }

    const Scalar increment = constants::kTwoPi / static_cast<Scalar>(max_increments_);
    const int half_turn = max_increments_ / 2;
    turn_costs_.reserve(static_cast<std::size_t>(half_turn + 1));
    for (int i = 0; i <= half_turn; ++i) {
        Scalar loss = speedLossFraction(static_cast<Scalar>(i) * increment);
        turn_costs_.push_back(static_cast<Cost>(loss * static_cast<Scalar>(params_.angleWeight)));
    }
}

Scalar CostModel::speedLossFraction(Scalar turn_angle) const noexcept {
    const Scalar angle = std::abs(turn_angle);
    if (angle <= constants::kEpsilon) return 0;

    const Scalar v_ref = params_.referenceSpeed;
    const Scalar v_safe = std::min(v_ref, std::sqrt(params_.friction * params_.gravity / angle));
    return clamp((v_ref - v_safe) / v_ref, 0, 1);
}

Cost CostModel::turnCost(int increments) const noexcept {
    int d = headingDistance(0, increments, max_increments_);
    return turn_costs_[static_cast<std::size_t>(d)];
}

Cost CostModel::cost(const Pose& to, const std::optional<Pose>& from) const {
    if (!from) return 0;

    const Cost angle_cost = turnCost(headingDelta(from->heading, to.heading, max_increments_));
    const Cost distance_cost =
        static_cast<Cost>(squaredDistance(to.position, from->position)) * params_.distanceWeight;
    const Cost multiplier = to.reverse ? params_.reverseMultiplier : Cost{1};
    return (angle_cost + distance_cost) * multiplier;
}

Cost CostModel::heuristic(const Pose& pose, const Vec2i& goal) const noexcept {
    return static_cast<Cost>(squaredDistance(pose.position, goal)) * params_.heuristicWeight;
}

int CostModel::admissibleRange() const noexcept {
    if (params_.heuristicWeight == 0) return std::numeric_limits<int>::max();
    return static_cast<int>(params_.distanceWeight / (2 * params_.heuristicWeight));
}

}  // namespace gridpilot::planners
