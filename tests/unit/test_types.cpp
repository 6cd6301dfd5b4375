// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <cmath>
#include <sstream>
#include <unordered_set>
#include "gridpilot/core/heading.hpp"
#include "gridpilot/core/pose.hpp"
#include "gridpilot/core/types.hpp"

using namespace gridpilot;

TEST(Types, Clamp) {
    EXPECT_EQ(clamp(5.0, 0.0, 10.0), 5.0);
    EXPECT_EQ(clamp(-1.0, 0.0, 10.0), 0.0);
    EXPECT_EQ(clamp(15.0, 0.0, 10.0), 10.0);
}

TEST(Types, CellDistances) {
    EXPECT_EQ(squaredDistance(Vec2i(0, 0), Vec2i(3, 4)), 25);
    EXPECT_EQ(squaredDistance(Vec2i(2, 2), Vec2i(1, 1)), 2);
    EXPECT_EQ(chebyshevDistance(Vec2i(0, 0), Vec2i(3, -4)), 4);
    EXPECT_EQ(chebyshevDistance(Vec2i(5, 5), Vec2i(5, 5)), 0);
}

TEST(Heading, Wrap) {
    EXPECT_EQ(wrapHeading(0, 8), 0);
    EXPECT_EQ(wrapHeading(-1, 8), 7);
    EXPECT_EQ(wrapHeading(9, 8), 1);
    EXPECT_EQ(wrapHeading(-17, 8), 7);
}

TEST(Heading, Delta) {
    EXPECT_EQ(headingDelta(0, 1, 8), 1);
    EXPECT_EQ(headingDelta(0, 7, 8), -1);
    EXPECT_EQ(headingDelta(7, 0, 8), 1);
    EXPECT_EQ(headingDelta(0, 5, 8), -3);
    // A half turn is reported as positive
    EXPECT_EQ(headingDelta(0, 4, 8), 4);
    EXPECT_EQ(headingDelta(6, 2, 8), 4);
    EXPECT_EQ(headingDistance(1, 14, 16), 3);
}

TEST(Heading, Validity) {
    EXPECT_TRUE(isValidHeading(0, 8));
    EXPECT_TRUE(isValidHeading(7, 8));
    EXPECT_FALSE(isValidHeading(8, 8));
    EXPECT_FALSE(isValidHeading(-1, 8));
}

TEST(Heading, AngleAndDirection) {
    EXPECT_NEAR(headingToAngle(2, 8), constants::kPi / 2, 1e-10);
    EXPECT_NEAR(headingToAngle(4, 16), constants::kPi / 2, 1e-10);

    Vec2 d = headingDirection(1, 8);
    EXPECT_NEAR(d.x(), std::sqrt(0.5), 1e-10);
    EXPECT_NEAR(d.y(), std::sqrt(0.5), 1e-10);
    EXPECT_NEAR(d.norm(), 1.0, 1e-10);
}

TEST(Heading, NeighbourStep) {
    EXPECT_EQ(neighbourStep(headingDirection(0, 8)), Vec2i(1, 0));
    EXPECT_EQ(neighbourStep(headingDirection(1, 8)), Vec2i(1, 1));
    EXPECT_EQ(neighbourStep(headingDirection(2, 8)), Vec2i(0, 1));
    EXPECT_EQ(neighbourStep(headingDirection(5, 8)), Vec2i(-1, -1));
    // 22.5 degrees rounds onto the x axis
    EXPECT_EQ(neighbourStep(headingDirection(1, 16)), Vec2i(1, 0));
    EXPECT_EQ(neighbourStep(Vec2(3.0, -2.0)), Vec2i(1, -1));
}

TEST(Pose, EqualityIgnoresDirection) {
    Pose forward(3, 4, 2, false);
    Pose backward(3, 4, 2, true);
    EXPECT_EQ(forward, backward);
    EXPECT_EQ(PoseHash{}(forward), PoseHash{}(backward));

    EXPECT_NE(Pose(3, 4, 2), Pose(3, 4, 3));
    EXPECT_NE(Pose(3, 4, 2), Pose(4, 3, 2));

    std::unordered_set<Pose, PoseHash> visited;
    visited.insert(forward);
    visited.insert(backward);
    EXPECT_EQ(visited.size(), 1u);
}

TEST(Pose, HashSeparatesLargeCoordinates) {
    PoseHash hash;
    EXPECT_NE(hash(Pose(2048, 0, 0)), hash(Pose(0, 1, 0)));
    EXPECT_NE(hash(Pose(0, 0, 1)), hash(Pose(0, 2048, 0)));
    EXPECT_NE(hash(Pose(3, 4, 2)), hash(Pose(4, 3, 2)));
}

TEST(Pose, Stream) {
    std::ostringstream os;
    os << Pose(1, 2, 3) << " " << Pose(4, 5, 0, true);
    EXPECT_EQ(os.str(), "(1, 2, h3) (4, 5, h0, rev)");
}
