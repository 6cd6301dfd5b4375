// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <stdexcept>
#include "gridpilot/planners/cost_model.hpp"

using namespace gridpilot;
using namespace gridpilot::planners;

TEST(CostModel, StartStateIsFree) {
    CostModel model(8);
    EXPECT_EQ(model.cost(Pose(3, 3, 2), std::nullopt), 0u);
}

TEST(CostModel, StraightAndDiagonalSteps) {
    CostModel model(8);
    const Pose from(0, 0, 0);
    EXPECT_EQ(model.cost(Pose(1, 0, 0), from), 1000u);
    // 45 degree turn plus a diagonal step
    EXPECT_EQ(model.cost(Pose(1, 1, 1), from), 408u + 2000u);
    EXPECT_EQ(model.cost(Pose(1, 1, 1), Pose(0, 0, 1)), 2000u);
}

TEST(CostModel, ReverseMultiplier) {
    CostModel model(8);
    const Pose from(5, 5, 0);
    EXPECT_EQ(model.cost(Pose(4, 5, 0, true), from), 5000u);
    EXPECT_EQ(model.cost(Pose(4, 6, 7, true), from), (408u + 2000u) * 5u);

    CostParams params;
    params.reverseMultiplier = 1;
    CostModel symmetric(8, params);
    EXPECT_EQ(symmetric.cost(Pose(4, 5, 0, true), from), symmetric.cost(Pose(6, 5, 0), from));
}

TEST(CostModel, TurnCostGrowsWithAngle) {
    CostModel model(8);
    EXPECT_EQ(model.turnCost(0), 0u);
    EXPECT_EQ(model.turnCost(1), 408u);
    EXPECT_EQ(model.turnCost(-1), 408u);
    EXPECT_EQ(model.turnCost(2), 581u);
    EXPECT_EQ(model.turnCost(7), model.turnCost(1));
    EXPECT_LT(model.turnCost(2), model.turnCost(3));
    EXPECT_LT(model.turnCost(3), model.turnCost(4));
    EXPECT_LE(model.turnCost(4), model.params().angleWeight);
}

TEST(CostModel, SpeedLoss) {
    CostModel model(16);
    // Gentle turns can be taken at full speed
    EXPECT_DOUBLE_EQ(model.speedLossFraction(0.0), 0.0);
    EXPECT_DOUBLE_EQ(model.speedLossFraction(0.1), 0.0);
    EXPECT_GT(model.speedLossFraction(constants::kPi / 8), 0.0);
    EXPECT_LT(model.speedLossFraction(constants::kPi), 1.0);
    EXPECT_DOUBLE_EQ(model.speedLossFraction(-0.5), model.speedLossFraction(0.5));
}

TEST(CostModel, Heuristic) {
    CostModel model(8);
    EXPECT_EQ(model.heuristic(Pose(0, 0, 0), Vec2i(3, 4)), 250u);
    EXPECT_EQ(model.heuristic(Pose(3, 4, 5), Vec2i(3, 4)), 0u);
    EXPECT_EQ(model.admissibleRange(), 50);
}

TEST(CostModel, GoalIgnoresHeading) {
    EXPECT_TRUE(CostModel::isGoal(Pose(2, 3, 5, true), Vec2i(2, 3)));
    EXPECT_FALSE(CostModel::isGoal(Pose(2, 4, 5), Vec2i(2, 3)));
}

TEST(CostModel, InvalidParameters) {
    EXPECT_THROW(CostModel(0), std::invalid_argument);

    CostParams p;
    p.distanceWeight = 0;
    EXPECT_THROW(CostModel(8, p), std::invalid_argument);

    p = CostParams{};
    p.reverseMultiplier = 0;
    EXPECT_THROW(CostModel(8, p), std::invalid_argument);

    p = CostParams{};
    p.friction = 0;
    EXPECT_THROW(CostModel(8, p), std::invalid_argument);
}
