// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// JSON export utilities for planned paths, grids and footprints.
// Output feeds offline plotting of planner runs.

#pragma once

#include <ostream>
#include <vector>

#include "gridpilot/collision/footprint.hpp"
#include "gridpilot/collision/occupancy_grid.hpp"
#include "gridpilot/core/result.hpp"

namespace gridpilot::io {

/// Export a PlannedPath as JSON (poses + cost).
void toJSON(std::ostream& os, const PlannedPath& path);

/// Export a PlanningResult as JSON (path + metrics).
void toJSON(std::ostream& os, const PlanningResult& result);

/// Export an OccupancyGrid as JSON (dimensions + blocked cells).
void toJSON(std::ostream& os, const collision::OccupancyGrid& grid);

/// Export the per-heading footprint masks of a FootprintCache.
void toJSON(std::ostream& os, const collision::FootprintCache& footprints);

/// Export a complete run (grid + result) as JSON.
void toJSON(std::ostream& os, const collision::OccupancyGrid& grid,
            const PlanningResult& result);

/// Export a batch of results as JSON.
void resultsToJSON(std::ostream& os, const std::vector<PlanningResult>& results);

}  // namespace gridpilot::io
