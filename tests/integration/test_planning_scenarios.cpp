// SPDX-License-Identifier: BSD-3-Clause
// Integration tests: run the full planning pipeline on the shipped scenarios.
#include <gtest/gtest.h>
#include <sstream>
#include "gridpilot/gridpilot.hpp"

using namespace gridpilot;

#ifndef GRIDPILOT_SCENARIO_DIR
#define GRIDPILOT_SCENARIO_DIR "examples/scenarios"
#endif

namespace {

// Planner stack built from one scenario
struct Pipeline {
    explicit Pipeline(const io::Scenario& s)
        : grid(s.buildGrid())
        , footprints(s.agent, s.heading.maxIncrements)
        , templates(s.heading.maxIncrements, s.heading.arc)
        , cost_model(s.heading.maxIncrements, s.cost)
        , planner(grid, footprints, templates, cost_model) {}

    collision::OccupancyGrid grid;
    collision::FootprintCache footprints;
    planners::MotionTemplateCache templates;
    planners::CostModel cost_model;
    planners::GridPlanner planner;
};

// Cost of the cheapest path, by uniform-cost search over the same lattice
std::optional<Cost> uniformCost(const Pipeline& p, const PathQuery& q) {
    auto outcome = search::bestFirstSearch<Pose, PoseHash>(
        Pose(q.start, q.startHeading), p.planner.stateCapacity(),
        [&](const Pose& s) { return p.planner.successors(s); },
        [](const Pose&) { return Cost{0}; },
        [&](const Pose& s) { return s.position == q.goal; });
    if (!outcome) return std::nullopt;
    return outcome->cost;
}

}  // namespace

class PlanningScenarioTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { log::setLevel(spdlog::level::warn); }

    std::vector<io::Scenario> loadShipped() {
        return io::loadScenariosFromDir(GRIDPILOT_SCENARIO_DIR);
    }

    void expectValidPath(const Pipeline& p, const io::Scenario& s, const PlannedPath& path) {
        ASSERT_FALSE(path.empty());
        EXPECT_EQ(path.front(), Pose(s.query.start, s.query.startHeading));
        EXPECT_EQ(path.back().position, s.query.goal);

        Cost total = 0;
        for (std::size_t i = 0; i < path.size(); ++i) {
            const auto& pose = path.poses[i];
            EXPECT_TRUE(p.planner.isPoseFree(pose)) << s.name << " pose " << pose;
            if (i == 0) continue;
            const auto& prev = path.poses[i - 1];
            EXPECT_EQ(chebyshevDistance(prev.position, pose.position), 1) << s.name;
            EXPECT_LE(headingDistance(prev.heading, pose.heading, p.templates.maxIncrements()),
                      pose.reverse ? 2 * s.heading.arc : s.heading.arc)
                << s.name;
            total += p.cost_model.cost(pose, prev);
        }
        EXPECT_EQ(total, path.cost) << s.name;
    }
};

TEST_F(PlanningScenarioTest, ShippedScenariosLoad) {
    auto scenarios = loadShipped();
    ASSERT_EQ(scenarios.size(), 3u);
    EXPECT_EQ(scenarios[0].name, "corridor");
    EXPECT_EQ(scenarios[1].name, "open_field");
    EXPECT_EQ(scenarios[2].name, "parking");
}

TEST_F(PlanningScenarioTest, ShippedScenariosSolve) {
    for (const auto& s : loadShipped()) {
        Pipeline p(s);
        auto result = p.planner.solve(s.query);
        ASSERT_EQ(result.status, SearchStatus::kSuccess) << s.name;
        expectValidPath(p, s, result.path);
    }
}

TEST_F(PlanningScenarioTest, MatchesUniformCostSearch) {
    // Every shipped query lies inside the heuristic's admissible range
    for (const auto& s : loadShipped()) {
        Pipeline p(s);
        ASSERT_LE(chebyshevDistance(s.query.start, s.query.goal),
                  p.cost_model.admissibleRange());

        auto path = p.planner.findPath(s.query.start, s.query.startHeading, s.query.goal);
        auto best = uniformCost(p, s.query);
        ASSERT_TRUE(path.has_value()) << s.name;
        ASSERT_TRUE(best.has_value()) << s.name;
        EXPECT_EQ(path->cost, *best) << s.name;
    }
}

TEST_F(PlanningScenarioTest, ObstacleEditsBetweenQueries) {
    io::Scenario s = io::parseScenarioJSON(R"({
        "grid": {"width": 16, "height": 8},
        "agent": {"halfWidth": 0.75, "halfHeight": 0.5},
        "heading": {"maxIncrements": 16, "arc": 1},
        "start": {"x": 1, "y": 3, "heading": 0},
        "goal": {"x": 12, "y": 3}
    })");
    Pipeline p(s);

    auto open = p.planner.solve(s.query);
    ASSERT_TRUE(open.success());
    expectValidPath(p, s, open.path);

    // Wall across the grid with a gap, then closed completely
    p.grid.fillRect(8, 0, 8, 7);
    p.grid.setBlocked(8, 5, false);
    p.grid.setBlocked(8, 6, false);
    auto detour = p.planner.solve(s.query);
    ASSERT_TRUE(detour.success());
    expectValidPath(p, s, detour.path);
    EXPECT_GT(detour.path.cost, open.path.cost);

    p.grid.setBlocked(8, 5);
    auto closed = p.planner.solve(s.query);
    EXPECT_EQ(closed.status, SearchStatus::kNoPath);
}

TEST_F(PlanningScenarioTest, ScenarioReportExport) {
    auto scenarios = loadShipped();
    ASSERT_FALSE(scenarios.empty());
    Pipeline p(scenarios.front());
    auto result = p.planner.solve(scenarios.front().query);

    std::ostringstream os;
    io::toJSON(os, p.grid, result);
    EXPECT_NE(os.str().find("\"status\":\"Success\""), std::string::npos);
    EXPECT_NE(os.str().find("\"width\":32"), std::string::npos);
}
