#ifndef __NPUZZLE_BFS_SOLVER_HPP___
#define __NPUZZLE_BFS_SOLVER_HPP___

/**
 * @file npuzzle-bfs-solver.hpp
 * @brief Breadth-first search solver for N-puzzle `State`.
 */

#include <vector>

#include "state.hpp"

/**
 * @brief Solve the puzzle using BFS (useful for small depths and as ground truth).
 *
 * @param start Starting puzzle state.
 * @param visited_nodes Optional out-parameter to receive number of expanded states.
 * @return Sequence of states from start to goal inclusive (empty if the goal is unreachable).
 */
std::vector<State> bfs_solve(const State &start, long long* visited_nodes = nullptr);

#endif // __NPUZZLE_BFS_SOLVER_HPP___
