// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/collision/occupancy_grid.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gridpilot::collision {

namespace {

std::size_t checkedCellCount(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("OccupancyGrid dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
}

}  // anonymous namespace

OccupancyGrid::OccupancyGrid(int width, int height)
    : width_(width), height_(height)
    , cells_(checkedCellCount(width, height)) {}

void OccupancyGrid::requireInBounds(int x, int y) const {
    if (!inBounds(x, y)) {
        throw std::out_of_range("Cell (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") outside " + std::to_string(width_) + "x" +
                                std::to_string(height_) + " grid");
    }
}

void OccupancyGrid::toggle(int x, int y) {
    requireInBounds(x, y);
    cells_.toggle(index(x, y));
}

void OccupancyGrid::setBlocked(int x, int y, bool blocked) {
    requireInBounds(x, y);
    cells_.assign(index(x, y), blocked);
}

void OccupancyGrid::fillRect(int x0, int y0, int x1, int y1, bool blocked) {
    int gx_min = std::max(0, std::min(x0, x1));
    int gx_max = std::min(width_ - 1, std::max(x0, x1));
    int gy_min = std::max(0, std::min(y0, y1));
    int gy_max = std::min(height_ - 1, std::max(y0, y1));

    for (int gy = gy_min; gy <= gy_max; ++gy) {
        for (int gx = gx_min; gx <= gx_max; ++gx) {
            cells_.assign(index(gx, gy), blocked);
        }
    }
}

bool OccupancyGrid::isBlocked(int x, int y) const {
    if (!inBounds(x, y)) return true;
    return cells_.test(index(x, y));
}

bool OccupancyGrid::isFootprintFree(const Vec2i& position,
                                    const std::vector<Vec2i>& offsets) const {
    return std::none_of(offsets.begin(), offsets.end(), [&](const Vec2i& o) {
        return isBlocked(position.x() + o.x(), position.y() + o.y());
    });
}

std::vector<Vec2i> OccupancyGrid::blockedCells() const {
    std::vector<Vec2i> out;
    out.reserve(cells_.count());
    for (std::size_t i = 0; i < cells_.size(); ++i) {
        if (cells_.test(i)) out.push_back(cellAt(i));
    }
    return out;
}

}  // namespace gridpilot::collision
