// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/io/json_export.hpp"

namespace gridpilot::io {

namespace {

void writeCells(std::ostream& os, const std::vector<Vec2i>& cells) {
    os << "[";
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) os << ",";
        os << "[" << cells[i].x() << "," << cells[i].y() << "]";
    }
    os << "]";
}

}  // anonymous namespace

void toJSON(std::ostream& os, const PlannedPath& path) {
    os << "{\"cost\":" << path.cost
       << ",\"reverse_steps\":" << path.reverseSteps()
       << ",\"poses\":[";
    for (std::size_t i = 0; i < path.poses.size(); ++i) {
        if (i > 0) os << ",";
        const auto& p = path.poses[i];
        os << "{\"x\":" << p.x()
           << ",\"y\":" << p.y()
           << ",\"heading\":" << p.heading
           << ",\"reverse\":" << (p.reverse ? "true" : "false") << "}";
    }
    os << "]}";
}

void toJSON(std::ostream& os, const PlanningResult& result) {
    os << "{";
    os << "\"status\":\"" << toString(result.status) << "\",";
    os << "\"planner\":\"" << result.plannerName << "\",";
    if (!result.message.empty()) {
        os << "\"message\":\"" << result.message << "\",";
    }
    os << "\"solve_time_ms\":" << result.solveTimeMs << ",";
    os << "\"expansions\":" << result.stats.expansions << ",";
    os << "\"generated\":" << result.stats.generated << ",";
    os << "\"peak_open_size\":" << result.stats.peakOpenSize << ",";
    os << "\"path\":";
    toJSON(os, result.path);
    os << "}";
}

void toJSON(std::ostream& os, const collision::OccupancyGrid& grid) {
    os << "{\"width\":" << grid.width()
       << ",\"height\":" << grid.height()
       << ",\"blocked\":";
    writeCells(os, grid.blockedCells());
    os << "}";
}

void toJSON(std::ostream& os, const collision::FootprintCache& footprints) {
    const auto& g = footprints.geometry();
    os << "{\"half_width\":" << g.halfWidth
       << ",\"half_height\":" << g.halfHeight
       << ",\"max_increments\":" << footprints.maxIncrements()
       << ",\"masks\":[";
    for (int h = 0; h < footprints.maxIncrements(); ++h) {
        if (h > 0) os << ",";
        writeCells(os, footprints.rotationFootprint(h));
    }
    os << "]}";
}

void toJSON(std::ostream& os, const collision::OccupancyGrid& grid,
            const PlanningResult& result) {
    os << "{\"grid\":";
    toJSON(os, grid);
    os << ",\"result\":";
    toJSON(os, result);
    os << "}";
}

void resultsToJSON(std::ostream& os, const std::vector<PlanningResult>& results) {
    os << "{\"results\":[";
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) os << ",";
        toJSON(os, results[i]);
    }
    os << "]}";
}

}  // namespace gridpilot::io
