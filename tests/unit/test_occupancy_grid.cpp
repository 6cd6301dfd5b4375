// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <stdexcept>
#include "gridpilot/collision/occupancy_grid.hpp"

using namespace gridpilot;
using namespace gridpilot::collision;

TEST(OccupancyGrid, Construction) {
    OccupancyGrid grid(10, 5);
    EXPECT_EQ(grid.width(), 10);
    EXPECT_EQ(grid.height(), 5);
    EXPECT_EQ(grid.cellCount(), 50u);
    EXPECT_EQ(grid.blockedCount(), 0u);
    EXPECT_FALSE(grid.isBlocked(0, 0));
    EXPECT_FALSE(grid.isBlocked(9, 4));
}

TEST(OccupancyGrid, InvalidDimensionsThrow) {
    EXPECT_THROW(OccupancyGrid(0, 5), std::invalid_argument);
    EXPECT_THROW(OccupancyGrid(5, -1), std::invalid_argument);
}

TEST(OccupancyGrid, OutsideIsBlocked) {
    OccupancyGrid grid(10, 5);
    EXPECT_TRUE(grid.isBlocked(-1, 0));
    EXPECT_TRUE(grid.isBlocked(10, 0));
    EXPECT_TRUE(grid.isBlocked(0, -1));
    EXPECT_TRUE(grid.isBlocked(0, 5));
    EXPECT_TRUE(grid.isBlocked(Vec2i(100, 100)));
}

TEST(OccupancyGrid, ToggleIsInvolutive) {
    OccupancyGrid grid(10, 5);
    grid.toggle(3, 2);
    EXPECT_TRUE(grid.isBlocked(3, 2));
    EXPECT_EQ(grid.blockedCount(), 1u);
    grid.toggle(3, 2);
    EXPECT_FALSE(grid.isBlocked(3, 2));
    EXPECT_EQ(grid.blockedCount(), 0u);
}

TEST(OccupancyGrid, MutationOutsideThrows) {
    OccupancyGrid grid(10, 5);
    EXPECT_THROW(grid.toggle(10, 0), std::out_of_range);
    EXPECT_THROW(grid.setBlocked(-1, 2), std::out_of_range);
}

TEST(OccupancyGrid, RowMajorIndexing) {
    OccupancyGrid grid(10, 5);
    EXPECT_EQ(grid.index(0, 0), 0u);
    EXPECT_EQ(grid.index(3, 2), 23u);
    EXPECT_EQ(grid.cellAt(23), Vec2i(3, 2));
    EXPECT_EQ(grid.cellAt(grid.index(9, 4)), Vec2i(9, 4));
}

TEST(OccupancyGrid, FillRectIsClipped) {
    OccupancyGrid grid(10, 5);
    grid.fillRect(-2, -2, 1, 1);
    EXPECT_EQ(grid.blockedCount(), 4u);
    EXPECT_TRUE(grid.isBlocked(0, 0));
    EXPECT_TRUE(grid.isBlocked(1, 1));
    EXPECT_FALSE(grid.isBlocked(2, 1));

    grid.fillRect(1, 1, 0, 0, false);
    EXPECT_EQ(grid.blockedCount(), 0u);

    grid.fillRect(8, 3, 20, 20);
    EXPECT_EQ(grid.blockedCount(), 4u);
    grid.clear();
    EXPECT_EQ(grid.blockedCount(), 0u);
}

TEST(OccupancyGrid, BlockedCellsInIndexOrder) {
    OccupancyGrid grid(4, 4);
    grid.setBlocked(2, 3);
    grid.setBlocked(1, 0);
    grid.setBlocked(3, 1);

    auto cells = grid.blockedCells();
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[0], Vec2i(1, 0));
    EXPECT_EQ(cells[1], Vec2i(3, 1));
    EXPECT_EQ(cells[2], Vec2i(2, 3));
}

TEST(OccupancyGrid, FootprintFree) {
    OccupancyGrid grid(6, 6);
    grid.setBlocked(3, 3);
    std::vector<Vec2i> square = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};

    EXPECT_TRUE(grid.isFootprintFree({0, 0}, square));
    EXPECT_FALSE(grid.isFootprintFree({2, 2}, square));
    EXPECT_FALSE(grid.isFootprintFree({3, 2}, square));
    EXPECT_TRUE(grid.isFootprintFree({4, 4}, square));
    // Hanging over the edge
    EXPECT_FALSE(grid.isFootprintFree({5, 0}, square));
}
