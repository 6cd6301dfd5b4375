// SPDX-License-Identifier: BSD-3-Clause
#include <benchmark/benchmark.h>
#include "gridpilot/planners/grid_planner.hpp"
#include "gridpilot/core/logging.hpp"

using namespace gridpilot;

static void BM_GridPlanner_EmptyGrid(benchmark::State& state) {
    const int size = static_cast<int>(state.range(0));
    log::setLevel(spdlog::level::warn);

    collision::OccupancyGrid grid(size, size);
    collision::FootprintCache footprints({0.75, 0.5}, 16);
    planners::MotionTemplateCache templates(16, 1);
    planners::CostModel cost_model(16);
    planners::GridPlanner planner(grid, footprints, templates, cost_model);

    for (auto _ : state) {
        auto path = planner.findPath({2, 2}, 0, {size - 3, size - 3});
        benchmark::DoNotOptimize(path);
    }
}
BENCHMARK(BM_GridPlanner_EmptyGrid)->Arg(16)->Arg(32)->Arg(48);

static void BM_GridPlanner_Walls(benchmark::State& state) {
    log::setLevel(spdlog::level::warn);

    collision::OccupancyGrid grid(48, 32);
    grid.fillRect(12, 0, 13, 22);
    grid.fillRect(24, 9, 25, 31);
    grid.fillRect(36, 0, 37, 22);
    collision::FootprintCache footprints({0.75, 0.5}, 16);
    planners::MotionTemplateCache templates(16, static_cast<int>(state.range(0)));
    planners::CostModel cost_model(16);
    planners::GridPlanner planner(grid, footprints, templates, cost_model);

    for (auto _ : state) {
        auto path = planner.findPath({3, 3}, 4, {44, 28});
        benchmark::DoNotOptimize(path);
    }
}
BENCHMARK(BM_GridPlanner_Walls)->Arg(1)->Arg(2)->Arg(3);

static void BM_FootprintCache_Build(benchmark::State& state) {
    log::setLevel(spdlog::level::warn);
    const int increments = static_cast<int>(state.range(0));

    for (auto _ : state) {
        collision::FootprintCache footprints({2.0, 1.0}, increments);
        benchmark::DoNotOptimize(footprints);
    }
}
BENCHMARK(BM_FootprintCache_Build)->Arg(8)->Arg(16)->Arg(64);

static void BM_MotionTemplateCache_Build(benchmark::State& state) {
    log::setLevel(spdlog::level::warn);
    const int increments = static_cast<int>(state.range(0));

    for (auto _ : state) {
        planners::MotionTemplateCache templates(increments, 1);
        benchmark::DoNotOptimize(templates);
    }
}
BENCHMARK(BM_MotionTemplateCache_Build)->Arg(8)->Arg(16)->Arg(64);
