#ifndef __NPUZZLE_A_STAR_SOLVER_HPP___
#define __NPUZZLE_A_STAR_SOLVER_HPP___

/**
 * @file npuzzle-a-star-solver.hpp
 * @brief Optimal A* / uniform-cost solver for the N-puzzle `State` type.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"

/**
 * @brief Solution and run statistics returned by astar().
 */
struct SearchResult {
    int moves = 0;                  ///< minimum number of blank moves
    std::vector<Move> path;         ///< moves from start to goal
    std::vector<State> boards;      ///< states from start to goal inclusive (moves + 1 entries)
    long long expanded = 0;         ///< states popped and expanded (stale entries excluded)
    std::size_t max_frontier = 0;   ///< largest frontier size observed right after a pop
    double elapsed_seconds = 0.0;   ///< wall-clock time of the search loop
};

/**
 * @brief Raised when the frontier empties without reaching the goal.
 *
 * Cannot happen for a state accepted by is_solvable(); it means the caller
 * skipped the solvability gate or the engine is broken.
 */
class SearchExhaustedError : public std::logic_error {
public:
    explicit SearchExhaustedError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Find a shortest move sequence from start to the canonical goal.
 *
 * Best-first graph search ordered by (f, h, g), remaining ties broken by
 * the states' cell order. With use_heuristic = false every estimate is 0
 * and the search degrades to uniform-cost search.
 *
 * Precondition: is_solvable(side_length, start).
 *
 * @param side_length Board side length; must match start.
 * @param start Starting puzzle state.
 * @param use_heuristic Use Manhattan + linear conflict (true) or h = 0 (false).
 * @return Solution path and statistics.
 * @throws SearchExhaustedError if the goal is unreachable.
 * @throws std::invalid_argument if side_length does not match start.
 */
SearchResult astar(int side_length, const State& start, bool use_heuristic = true);

#endif // __NPUZZLE_A_STAR_SOLVER_HPP___
