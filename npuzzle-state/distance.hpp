#ifndef __DISTANCE_HPP___
#define __DISTANCE_HPP___

/**
 * @file distance.hpp
 * @brief Heuristic distance functions for N-puzzle states.
 *
 * Manhattan distance plus linear conflict. The sum never overestimates the
 * number of remaining moves and is consistent across single moves.
 */

#include <vector>

#include "state.hpp"

/**
 * @brief Goal coordinates of one tile value.
 */
struct GoalPosition {
    int row;
    int column;
};

/**
 * @brief Lookup table indexed by tile value (0..n*n-1).
 */
typedef std::vector<GoalPosition> GoalPositions;

/**
 * @brief Precompute goal coordinates for every tile value.
 *
 * Value v in 1..n*n-1 maps to ((v-1)/n, (v-1)%n); the blank maps to (n-1, n-1).
 *
 * @param side_length Board side length.
 * @return Table with side_length*side_length entries.
 */
GoalPositions build_goal_positions(int side_length);

/**
 * @brief Sum of row and column distances of every tile from its goal cell.
 *
 * @param side_length Board side length.
 * @param state Current state.
 * @param goal_positions Table from build_goal_positions(side_length).
 * @return Manhattan distance (blank ignored).
 * @throws std::invalid_argument if the table or state does not match side_length.
 */
int manhattan_distance(int side_length, const State& state, const GoalPositions& goal_positions);

/**
 * @brief Extra cost of goal-aligned tiles that must pass each other.
 *
 * For every row, among the tiles whose goal row is that row, each pair in
 * reversed goal-column order adds 2. Columns are treated the same way using
 * goal rows.
 */
int linear_conflict(int side_length, const State& state, const GoalPositions& goal_positions);

/**
 * @brief Combined estimate: manhattan_distance + linear_conflict. Zero exactly at the goal.
 */
int heuristic(int side_length, const State& state, const GoalPositions& goal_positions);

#endif // __DISTANCE_HPP___
