#include <algorithm>
#include <chrono>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "state.hpp"
#include "distance.hpp"
#include "npuzzle-a-star-solver.hpp"

using namespace std;

// Best known cost of a visited state and the link it was reached through.
// parent points at a key of the same map; element addresses survive rehashing.
struct NodeRecord {
    int g;
    const State* parent;
    Move move;
};

struct FrontierEntry {
    int f;
    int h;
    int g;
    const State* state;
};

// std::priority_queue keeps the greatest element on top, so "greater" pops first.
struct FrontierOrder {
    bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
        if (a.f != b.f) return a.f > b.f;
        if (a.h != b.h) return a.h > b.h;
        if (a.g != b.g) return a.g > b.g;
        return *b.state < *a.state;
    }
};

typedef unordered_map<State, NodeRecord, StateHasher> NodeTable;

static void reconstruct_path(const NodeTable& nodes, const State& goal, SearchResult& result) {
    const State* node = &goal;
    while (node) {
        result.boards.push_back(*node);
        const NodeRecord& record = nodes.at(*node);
        if (record.parent) result.path.push_back(record.move);
        node = record.parent;
    }
    reverse(result.boards.begin(), result.boards.end());
    reverse(result.path.begin(), result.path.end());
}

SearchResult astar(int side_length, const State& start, bool use_heuristic) {
    if (start.get_side_length() != side_length) {
        throw invalid_argument("State side length " + to_string(start.get_side_length()) +
                               " does not match n=" + to_string(side_length));
    }

    SearchResult result;
    if (start.is_goal()) {
        result.boards.push_back(start);
        return result;
    }

    const GoalPositions goal_positions = build_goal_positions(side_length);
    auto t0 = chrono::steady_clock::now();

    NodeTable nodes;
    priority_queue<FrontierEntry, vector<FrontierEntry>, FrontierOrder> frontier;

    int h0 = use_heuristic ? heuristic(side_length, start, goal_positions) : 0;
    auto root = nodes.emplace(start, NodeRecord{0, nullptr, Move::Up}).first;
    frontier.push(FrontierEntry{h0, h0, 0, &root->first});

    while (!frontier.empty()) {
        FrontierEntry current = frontier.top();
        frontier.pop();
        const State& state = *current.state;

        // a cheaper path to this state was pushed after this entry
        if (current.g != nodes.at(state).g) continue;

        ++result.expanded;
        result.max_frontier = max(result.max_frontier, frontier.size());

        if (state.is_goal()) {
            auto t1 = chrono::steady_clock::now();
            result.elapsed_seconds = chrono::duration_cast<chrono::duration<double>>(t1 - t0).count();
            result.moves = current.g;
            reconstruct_path(nodes, state, result);
            return result;
        }

        for (auto& successor : state.get_available_moves()) {
            int g = current.g + 1;
            auto it = nodes.find(successor.first);
            if (it == nodes.end()) {
                it = nodes.emplace(std::move(successor.first), NodeRecord{g, &state, successor.second}).first;
            } else if (g < it->second.g) {
                it->second = NodeRecord{g, &state, successor.second};
            } else {
                continue;
            }
            int h = use_heuristic ? heuristic(side_length, it->first, goal_positions) : 0;
            frontier.push(FrontierEntry{g + h, h, g, &it->first});
        }
    }

    throw SearchExhaustedError("Frontier exhausted after " + to_string(result.expanded) +
                               " expansions without reaching the goal; the start state is not solvable");
}
