#ifndef PUZZLE_STLASTAR_SOLVER_HPP
#define PUZZLE_STLASTAR_SOLVER_HPP

/**
 * @file npuzzle-stlastar-solver.hpp
 * @brief Adapter running the N-puzzle `State` through the stlastar A* template.
 *
 * Used as an independent cross-check of the move counts found by astar().
 */

#include <vector>

#include "state.hpp"

/**
 * @brief Solve the puzzle using the stlastar implementation of A*.
 *
 * The heuristic is Manhattan distance plus linear conflict and every move
 * costs 1, so the returned path is optimal.
 *
 * @param start Starting puzzle state.
 * @param visited_nodes Optional out-parameter to receive the library's step count.
 * @return Sequence of states from start to goal inclusive (empty if the search
 *         failed or ran out of its node pool).
 */
std::vector<State> PuzzleSolveAstar(const State &start, int* visited_nodes = nullptr);

#endif // PUZZLE_STLASTAR_SOLVER_HPP
