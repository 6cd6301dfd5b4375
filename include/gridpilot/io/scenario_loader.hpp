// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Scenario loader: reads JSON scenario definitions (grid, agent, heading
// resolution, cost parameters, query) for the example driver and tests.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "gridpilot/collision/footprint.hpp"
#include "gridpilot/collision/occupancy_grid.hpp"
#include "gridpilot/core/result.hpp"
#include "gridpilot/planners/cost_model.hpp"

namespace gridpilot::io {

struct HeadingConfig {
    int maxIncrements{16};
    int arc{1};
};

/// Everything needed to build the planner stack and issue one query.
struct Scenario {
    std::string name;
    int gridWidth{32};
    int gridHeight{18};
    std::vector<Vec2i> blocked;

    collision::AgentGeometry agent;
    HeadingConfig heading;
    planners::CostParams cost;
    PathQuery query;

    /// Grid with every listed cell blocked. Throws std::out_of_range for a
    /// listed cell outside the grid.
    [[nodiscard]] collision::OccupancyGrid buildGrid() const;
};

/// Parse a scenario from JSON text. Throws std::runtime_error on malformed
/// input or missing required keys.
[[nodiscard]] Scenario parseScenarioJSON(std::string_view json);

/// Load a scenario from a JSON file. The scenario name defaults to the file stem.
[[nodiscard]] Scenario loadScenarioJSON(const std::filesystem::path& path);

/// Load every .json scenario of a directory, sorted by file name.
[[nodiscard]] std::vector<Scenario> loadScenariosFromDir(const std::filesystem::path& dir);

/// Save a scenario to a JSON file.
void saveScenarioJSON(const std::filesystem::path& path, const Scenario& scenario);

}  // namespace gridpilot::io
