// SPDX-License-Identifier: BSD-3-Clause
// GridPilot Scenario Planning Example
// Demonstrates: loading a JSON scenario, building the caches, planning and
// exporting the result.
//
// Usage: plan_scenario <scenario.json> [report.json] [--log-level <level>]

#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "gridpilot/gridpilot.hpp"

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <scenario.json> [report.json] [--log-level <level>]" << std::endl;
}

}  // anonymous namespace

int main(int argc, char** argv) {
    using namespace gridpilot;

    std::vector<std::string> positional;
    std::string level = "info";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty() || positional.size() > 2) {
        printUsage(argv[0]);
        return 2;
    }

    auto logger = log::get();
    try {
        log::setLevel(log::parseLevel(level));

        // ── Load scenario ────────────────────────────────────────────────────
        auto scenario = io::loadScenarioJSON(positional[0]);
        logger->info("Scenario '{}': {}x{} grid, {} blocked cells, agent {}x{}",
                     scenario.name, scenario.gridWidth, scenario.gridHeight,
                     scenario.blocked.size(), 2 * scenario.agent.halfWidth,
                     2 * scenario.agent.halfHeight);

        // ── Build grid and caches ────────────────────────────────────────────
        auto grid = scenario.buildGrid();
        collision::FootprintCache footprints(scenario.agent, scenario.heading.maxIncrements);
        planners::MotionTemplateCache templates(scenario.heading.maxIncrements,
                                                scenario.heading.arc);
        planners::CostModel cost_model(scenario.heading.maxIncrements, scenario.cost);
        planners::GridPlanner planner(grid, footprints, templates, cost_model);

        // ── Plan ─────────────────────────────────────────────────────────────
        auto result = planner.solve(scenario.query);
        if (result.success()) {
            logger->info("{}: {} | time={:.3f}ms | poses={} | cost={} | reverse steps={} | "
                         "expansions={}",
                         planner.name(), toString(result.status), result.solveTimeMs,
                         result.path.size(), result.path.cost, result.path.reverseSteps(),
                         result.stats.expansions);
            for (const auto& pose : result.path.poses) {
                std::cout << pose << std::endl;
            }
        } else {
            logger->warn("{}: {} {}", planner.name(), toString(result.status), result.message);
        }

        // ── Export report ────────────────────────────────────────────────────
        if (positional.size() == 2) {
            std::ofstream ofs(positional[1]);
            if (!ofs) {
                logger->error("Cannot write report: {}", positional[1]);
                return 1;
            }
            io::toJSON(ofs, grid, result);
            logger->info("Wrote {}", positional[1]);
        }

        return result.status == SearchStatus::kInvalidQuery ? 1 : 0;
    } catch (const std::exception& e) {
        logger->error("{}", e.what());
        return 1;
    }
}
