// SPDX-License-Identifier: BSD-3-Clause
// Footprint rasterization: rotated rectangle vs. unit grid cells (SAT).

#include "gridpilot/collision/footprint.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

#include "gridpilot/core/logging.hpp"

namespace gridpilot::collision {

namespace {

// Interval of a convex vertex set projected onto an axis
struct Interval {
    Scalar lo;
    Scalar hi;
};

template <std::size_t N>
Interval project(const std::array<Vec2, N>& vertices, const Vec2& axis) {
    Interval out{constants::kInfinity, -constants::kInfinity};
    for (const auto& v : vertices) {
        Scalar p = v.dot(axis);
        out.lo = std::min(out.lo, p);
        out.hi = std::max(out.hi, p);
    }
    return out;
}

std::array<Vec2, 4> rectangleCorners(const Vec2& center, const Vec2& half_extents,
                                     const Rot2& rotation) {
    const Scalar hx = half_extents.x();
    const Scalar hy = half_extents.y();
    return {
        center + rotation * Vec2(-hx, -hy),
        center + rotation * Vec2( hx, -hy),
        center + rotation * Vec2( hx,  hy),
        center + rotation * Vec2(-hx,  hy),
    };
}

// Fits inside a single cell on both axes
constexpr Scalar kSingleCellSlack = static_cast<Scalar>(1e-6);

}  // anonymous namespace

bool rectangleOverlapsCell(const Vec2& center, const Vec2& half_extents,
                           Scalar angle, const Vec2i& cell, Scalar tolerance) {
    const Rot2 rotation(angle);
    const auto rect = rectangleCorners(center, half_extents, rotation);

    const Vec2 c0(static_cast<Scalar>(cell.x()), static_cast<Scalar>(cell.y()));
    const std::array<Vec2, 4> box = {
        c0,
        c0 + Vec2(1, 0),
        c0 + Vec2(1, 1),
        c0 + Vec2(0, 1),
    };

    const std::array<Vec2, 4> axes = {
        rotation * Vec2(1, 0),   // rectangle face normals
        rotation * Vec2(0, 1),
        Vec2(1, 0),              // grid axes
        Vec2(0, 1),
    };

    for (const auto& axis : axes) {
        Interval a = project(rect, axis);
        Interval b = project(box, axis);
        if (std::min(a.hi, b.hi) - std::max(a.lo, b.lo) < tolerance) {
            return false;   // separating axis found
        }
    }
    return true;
}

// ═════════════════════════════════════════════════════════════════════════════
// FootprintCache
// ═════════════════════════════════════════════════════════════════════════════

FootprintCache::FootprintCache(AgentGeometry geometry, int max_increments)
    : geometry_(geometry), max_increments_(max_increments) {
    if (max_increments_ < 1) {
        throw std::invalid_argument("FootprintCache: maxIncrements must be >= 1, got " +
                                    std::to_string(max_increments_));
    }
    if (!(geometry_.halfWidth > 0) || !(geometry_.halfHeight > 0) ||
        !std::isfinite(geometry_.halfWidth) || !std::isfinite(geometry_.halfHeight)) {
        throw std::invalid_argument("FootprintCache: agent half-extents must be positive and finite");
    }

    // Sub-cell agents collapse onto their anchor cell at every heading
    single_cell_ = 2 * geometry_.halfWidth <= Scalar(1) + kSingleCellSlack &&
                   2 * geometry_.halfHeight <= Scalar(1) + kSingleCellSlack;

    masks_.reserve(static_cast<std::size_t>(max_increments_));
    for (HeadingIncrement h = 0; h < max_increments_; ++h) {
        masks_.push_back(buildMask(h));
    }

    log::get()->debug("Footprint cache: {} headings, half-extents ({}, {}), largest mask {} cells",
                      max_increments_, geometry_.halfWidth, geometry_.halfHeight,
                      maxFootprintSize());
}

std::vector<Vec2i> FootprintCache::buildMask(HeadingIncrement heading) const {
    if (single_cell_) return {Vec2i(0, 0)};

    const Scalar angle = headingToAngle(heading, max_increments_);
    const Vec2 half = geometry_.halfExtents();
    const auto corners = rectangleCorners(Vec2::Zero(), half, Rot2(angle));

    Vec2 lo = corners[0];
    Vec2 hi = corners[0];
    for (const auto& c : corners) {
        lo = lo.cwiseMin(c);
        hi = hi.cwiseMax(c);
    }

    const Vec2 center = pivot();
    const int x_min = static_cast<int>(std::floor(center.x() + lo.x()));
    const int x_max = static_cast<int>(std::floor(center.x() + hi.x()));
    const int y_min = static_cast<int>(std::floor(center.y() + lo.y()));
    const int y_max = static_cast<int>(std::floor(center.y() + hi.y()));

    std::vector<Vec2i> mask;
    for (int x = x_min; x <= x_max; ++x) {
        for (int y = y_min; y <= y_max; ++y) {
            Vec2i cell(x, y);
            if (rectangleOverlapsCell(center, half, angle, cell)) {
                mask.push_back(cell);
            }
        }
    }
    return mask;
}

const std::vector<Vec2i>& FootprintCache::rotationFootprint(HeadingIncrement heading) const {
    if (!isValidHeading(heading, max_increments_)) {
        throw std::out_of_range("FootprintCache: heading " + std::to_string(heading) +
                                " outside [0, " + std::to_string(max_increments_) + ")");
    }
    return masks_[static_cast<std::size_t>(heading)];
}

std::vector<Vec2i> FootprintCache::footprint(const Vec2i& position,
                                             HeadingIncrement heading) const {
    const auto& mask = rotationFootprint(heading);
    std::vector<Vec2i> cells;
    cells.reserve(mask.size());
    for (const auto& offset : mask) {
        cells.push_back(position + offset);
    }
    return cells;
}

std::size_t FootprintCache::maxFootprintSize() const noexcept {
    std::size_t n = 0;
    for (const auto& m : masks_) n = std::max(n, m.size());
    return n;
}

}  // namespace gridpilot::collision
