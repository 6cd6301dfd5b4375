// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Path query and planning result types.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "gridpilot/core/pose.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot {

// ─── Search Status ───────────────────────────────────────────────────────────
enum class SearchStatus {
    kSuccess,        // Found a path to the goal
    kNoPath,         // Reachable set exhausted without touching the goal
    kInvalidQuery,   // Query references an invalid heading
    kNotSolved,      // Solve has not been called
};

[[nodiscard]] constexpr std::string_view toString(SearchStatus s) noexcept {
    switch (s) {
        case SearchStatus::kSuccess:      return "Success";
        case SearchStatus::kNoPath:       return "NoPath";
        case SearchStatus::kInvalidQuery: return "InvalidQuery";
        case SearchStatus::kNotSolved:    return "NotSolved";
    }
    return "Unknown";
}

// ─── Search Statistics ───────────────────────────────────────────────────────
struct SearchStats {
    std::size_t expansions{0};     // Nodes popped and expanded
    std::size_t generated{0};      // Nodes pushed onto the open set
    std::size_t peakOpenSize{0};   // Largest open-set size observed
};

// ─── Planned Path ────────────────────────────────────────────────────────────
/// Ordered pose sequence from start (front) to goal (back) and its cost.
struct PlannedPath {
    std::vector<Pose> poses;
    Cost cost{0};

    [[nodiscard]] std::size_t size() const noexcept { return poses.size(); }
    [[nodiscard]] bool empty() const noexcept { return poses.empty(); }
    [[nodiscard]] const Pose& front() const { return poses.front(); }
    [[nodiscard]] const Pose& back() const { return poses.back(); }

    /// Number of edges driven in reverse
    [[nodiscard]] std::size_t reverseSteps() const noexcept {
        std::size_t n = 0;
        for (const auto& p : poses) n += p.reverse ? 1 : 0;
        return n;
    }
};

// ─── Path Query ──────────────────────────────────────────────────────────────
struct PathQuery {
    Vec2i start{0, 0};
    HeadingIncrement startHeading{0};
    Vec2i goal{0, 0};
};

// ─── Planning Result ─────────────────────────────────────────────────────────
struct PlanningResult {
    SearchStatus status{SearchStatus::kNotSolved};
    PlannedPath path;

    // Performance metrics
    double solveTimeMs{0};   // Wall-clock planning time (milliseconds)
    SearchStats stats;

    std::string plannerName;
    std::string message;     // Populated for kInvalidQuery

    [[nodiscard]] bool success() const noexcept {
        return status == SearchStatus::kSuccess;
    }
};

}  // namespace gridpilot
