// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// 2D occupancy grid: bit-packed blocked/free cells.

#pragma once

#include <cstddef>
#include <vector>

#include "gridpilot/collision/bit_array.hpp"
#include "gridpilot/core/concepts.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot::collision {

/// Fixed-size grid of blocked/free cells, one bit per cell at
/// index y * width + x. Cells outside [0, width) x [0, height) read as
/// blocked. The search only reads the grid; callers mutate it between queries.
class OccupancyGrid {
public:
    /// Throws std::invalid_argument if either dimension is not positive.
    OccupancyGrid(int width, int height);

    // ── Grid manipulation ────────────────────────────────────────────────────

    /// Flip a cell between blocked and free. Throws std::out_of_range
    /// outside the grid.
    void toggle(int x, int y);

    /// Set a cell's state. Throws std::out_of_range outside the grid.
    void setBlocked(int x, int y, bool blocked = true);

    /// Mark every cell of an inclusive rectangle, clipped to the grid.
    void fillRect(int x0, int y0, int x1, int y1, bool blocked = true);

    /// Free all cells
    void clear() noexcept { cells_.clearAll(); }

    // ── Queries (OccupancyMap concept) ───────────────────────────────────────

    [[nodiscard]] bool isBlocked(int x, int y) const;
    [[nodiscard]] bool isBlocked(const Vec2i& cell) const { return isBlocked(cell.x(), cell.y()); }

    /// True if none of `offsets`, translated by `position`, is blocked.
    [[nodiscard]] bool isFootprintFree(const Vec2i& position,
                                       const std::vector<Vec2i>& offsets) const;

    [[nodiscard]] std::size_t blockedCount() const noexcept { return cells_.count(); }

    // ── Coordinate conversion ────────────────────────────────────────────────

    [[nodiscard]] bool inBounds(int x, int y) const noexcept {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }
    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(x);
    }
    /// Inverse of index()
    [[nodiscard]] Vec2i cellAt(std::size_t index) const noexcept {
        return {static_cast<int>(index % static_cast<std::size_t>(width_)),
                static_cast<int>(index / static_cast<std::size_t>(width_))};
    }

    // ── Accessors ────────────────────────────────────────────────────────────
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::size_t cellCount() const noexcept { return cells_.size(); }

    /// Coordinates of every blocked cell, in index order.
    [[nodiscard]] std::vector<Vec2i> blockedCells() const;

private:
    int width_, height_;
    BitArray cells_;   // set = blocked

    void requireInBounds(int x, int y) const;
};

// Concept verification
static_assert(OccupancyMap<OccupancyGrid>);

}  // namespace gridpilot::collision
