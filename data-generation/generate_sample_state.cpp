#include <queue>
#include <random>
#include <unordered_set>
#include <vector>

#include "state.hpp"
#include "generate_sample_state.hpp"

State random_state_random_walk(int side_size, int target_depth, std::mt19937 &rng) {
    State temp_state = State::goal(side_size);
    for (int i = 0; i < target_depth; ++i) {
        auto moves = temp_state.get_available_moves();
        std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
        temp_state = moves[dist(rng)].first;
    }
    return temp_state;
}

State random_state_bfs(int side_size, int target_depth, std::mt19937 &rng) {
    State start_state = State::goal(side_size);

    std::queue<std::pair<State, int>> frontier;
    std::unordered_set<State, StateHasher> explored;
    frontier.push({start_state, 0});
    explored.insert(start_state);

    std::vector<State> candidates;

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        const State& state = current.first;
        int depth = current.second;

        if (depth == target_depth) {
            candidates.push_back(state);
            continue;
        }

        for (const auto &move : state.get_available_moves()) {
            if (explored.insert(move.first).second) {
                frontier.push({move.first, depth + 1});
            }
        }
    }

    if (candidates.empty()) {
        // no node found at that depth; return start as fallback
        return start_state;
    }

    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}
