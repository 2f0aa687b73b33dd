#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include <random>

#include "state.hpp"

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create random solvable puzzle states for benchmarks and testing.
 *
 * Two sampling strategies are provided:
 * - random walk: perform `target_depth` random legal moves from the goal state
 * - BFS sampling: collect all states at exact depth and pick one uniformly
 */

/**
 * @brief Generate a random state by performing a random walk from the solved state.
 *
 * The optimal solution of the result is at most `target_depth` moves long.
 *
 * @param side_size Board side length (3..8).
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled `State`.
 */
State random_state_random_walk(int side_size, int target_depth, std::mt19937 &rng);

/**
 * @brief Generate a random state by uniform sampling among states at exact BFS depth.
 *
 * The function performs a breadth-first search from the solved state up to
 * `target_depth` and uniformly selects one of the states at that depth, so
 * its optimal solution is exactly `target_depth` moves long.
 *
 * @param side_size Board side length (3..8).
 * @param target_depth Depth to sample at (distance from solved state).
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled `State`. Returns the solved state if no state exists at that depth.
 */
State random_state_bfs(int side_size, int target_depth, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_STATE_HPP___
