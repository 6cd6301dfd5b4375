// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Generic best-first (A*) search over any hashable state type.
//
// Nodes live in one std::vector and refer to their predecessor by index, so
// the whole search tree is released in bulk when the call returns. The open
// set is a binary heap of (fCost, node index) pairs; equal fCost pops in
// insertion order, which makes repeated runs deterministic.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gridpilot/core/concepts.hpp"
#include "gridpilot/core/result.hpp"
#include "gridpilot/core/types.hpp"

namespace gridpilot::search {

/// Path from start (front) to goal (back) and its accumulated cost.
template <typename State>
struct SearchOutcome {
    std::vector<State> path;
    Cost cost{0};
};

namespace detail {

template <typename State>
struct Node {
    State state;
    Cost g_cost;
    Cost f_cost;
    std::size_t parent;   // kNoParent for the start node
};

inline constexpr std::size_t kNoParent = static_cast<std::size_t>(-1);

struct OpenEntry {
    Cost f_cost;
    std::size_t node;
};

// Min-heap on fCost, then on insertion order
struct OpenEntryGreater {
    bool operator()(const OpenEntry& a, const OpenEntry& b) const noexcept {
        if (a.f_cost != b.f_cost) return a.f_cost > b.f_cost;
        return a.node > b.node;
    }
};

struct BestCost {
    Cost g_cost;
    std::size_t node;
};

}  // namespace detail

/// Run best-first search from `start`.
///
/// - `neighbors(state)` returns a range of (next state, edge cost) pairs.
/// - `heuristic(state)` estimates the cost still to go.
/// - `is_goal(state)` ends the search when the state is popped.
///
/// `capacity_hint` pre-sizes the node pool and cost map; it should bound the
/// number of distinct states the search can reach. Returns std::nullopt once
/// the open set is exhausted without reaching a goal.
template <typename State, typename Hash = std::hash<State>,
          typename NeighborsFn, typename HeuristicFn, typename GoalFn>
[[nodiscard]] std::optional<SearchOutcome<State>> bestFirstSearch(
    const State& start, std::size_t capacity_hint,
    NeighborsFn&& neighbors, HeuristicFn&& heuristic, GoalFn&& is_goal,
    SearchStats* stats = nullptr)
    requires SearchState<State, Hash>
{
    using Node = detail::Node<State>;

    std::vector<Node> pool;
    pool.reserve(capacity_hint);

    std::vector<detail::OpenEntry> heap_storage;
    heap_storage.reserve(capacity_hint);
    std::priority_queue<detail::OpenEntry, std::vector<detail::OpenEntry>,
                        detail::OpenEntryGreater>
        open(detail::OpenEntryGreater{}, std::move(heap_storage));

    std::unordered_map<State, detail::BestCost, Hash> best;
    best.reserve(capacity_hint);

    SearchStats local_stats;

    // Seed the search
    pool.push_back(Node{start, 0, static_cast<Cost>(heuristic(start)), detail::kNoParent});
    open.push({pool.back().f_cost, 0});
    best.emplace(start, detail::BestCost{0, 0});
    local_stats.generated = 1;
    local_stats.peakOpenSize = 1;

    auto finish = [&]() {
        if (stats) *stats = local_stats;
    };

    while (!open.empty()) {
        const std::size_t current_idx = open.top().node;
        open.pop();

        // Skip entries superseded by a cheaper route found after they were pushed
        {
            auto it = best.find(pool[current_idx].state);
            if (it != best.end() && it->second.node != current_idx) continue;
        }

        ++local_stats.expansions;

        if (is_goal(pool[current_idx].state)) {
            SearchOutcome<State> outcome;
            outcome.cost = pool[current_idx].g_cost;
            for (std::size_t i = current_idx; i != detail::kNoParent; i = pool[i].parent) {
                outcome.path.push_back(pool[i].state);
            }
            std::reverse(outcome.path.begin(), outcome.path.end());
            finish();
            return outcome;
        }

        // Copy: expanding may reallocate the pool
        const State current_state = pool[current_idx].state;
        const Cost current_g = pool[current_idx].g_cost;

        for (auto&& [neighbor, move_cost] : neighbors(current_state)) {
            const Cost tentative_g = current_g + static_cast<Cost>(move_cost);

            auto it = best.find(neighbor);
            if (it != best.end() && tentative_g >= it->second.g_cost) continue;

            const std::size_t idx = pool.size();
            const Cost f = tentative_g + static_cast<Cost>(heuristic(neighbor));
            pool.push_back(Node{neighbor, tentative_g, f, current_idx});

            if (it != best.end()) {
                it->second = detail::BestCost{tentative_g, idx};
            } else {
                best.emplace(neighbor, detail::BestCost{tentative_g, idx});
            }

            open.push({f, idx});
            ++local_stats.generated;
            local_stats.peakOpenSize = std::max(local_stats.peakOpenSize, open.size());
        }
    }

    finish();
    return std::nullopt;
}

}  // namespace gridpilot::search
