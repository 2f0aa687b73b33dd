#include <algorithm>
#include <queue>
#include <unordered_map>
#include <vector>

#include "state.hpp"
#include "npuzzle-bfs-solver.hpp"

std::vector<State> bfs_solve(const State &start, long long* visited_nodes) {
    std::vector<State> path;
    if (visited_nodes) *visited_nodes = 0;

    // parent links double as the explored set; the start has no parent
    std::unordered_map<State, const State*, StateHasher> parent;
    std::queue<const State*> frontier;
    auto root = parent.emplace(start, nullptr).first;
    frontier.push(&root->first);

    while (!frontier.empty()) {
        const State* state = frontier.front();
        frontier.pop();

        if (state->is_goal()) {
            for (const State* node = state; node; node = parent.at(*node)) {
                path.push_back(*node);
            }
            std::reverse(path.begin(), path.end());
            break;
        }

        if (visited_nodes) {
            (*visited_nodes)++;
        }
        for (auto &move : state->get_available_moves()) {
            auto inserted = parent.emplace(std::move(move.first), state);
            if (inserted.second) {
                frontier.push(&inserted.first->first);
            }
        }
    }
    return path;
}
