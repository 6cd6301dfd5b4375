// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// GridPilot: collision-aware motion-primitive path planning on occupancy grids.
// Umbrella header for convenient inclusion.

#pragma once

// Core
#include "gridpilot/core/types.hpp"
#include "gridpilot/core/heading.hpp"
#include "gridpilot/core/pose.hpp"
#include "gridpilot/core/concepts.hpp"
#include "gridpilot/core/result.hpp"
#include "gridpilot/core/logging.hpp"

// Collision
#include "gridpilot/collision/bit_array.hpp"
#include "gridpilot/collision/occupancy_grid.hpp"
#include "gridpilot/collision/footprint.hpp"

// Search
#include "gridpilot/search/best_first.hpp"

// Planners
#include "gridpilot/planners/motion_templates.hpp"
#include "gridpilot/planners/cost_model.hpp"
#include "gridpilot/planners/grid_planner.hpp"

// Robot Models
#include "gridpilot/robots/agent.hpp"

// IO
#include "gridpilot/io/json_export.hpp"
#include "gridpilot/io/scenario_loader.hpp"
