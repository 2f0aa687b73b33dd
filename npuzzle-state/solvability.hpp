#ifndef __SOLVABILITY_HPP___
#define __SOLVABILITY_HPP___

/**
 * @file solvability.hpp
 * @brief Parity test deciding whether a state can reach the goal.
 */

#include "state.hpp"

/**
 * @brief Count inversions among the tiles, ignoring the blank.
 *
 * @param state State to inspect.
 * @return Number of pairs (i < j) of tiles in row-major order with value_i > value_j.
 */
long long inversion_count(const State& state);

/**
 * @brief Decide whether the goal arrangement is reachable from a state.
 *
 * Odd sides: solvable iff the inversion count is even. Even sides: with
 * the blank's row counted from the bottom starting at 1, solvable iff that
 * row is even and the inversions odd, or the row is odd and the inversions even.
 *
 * @param side_length Board side length; must match the state's.
 * @param state State to test.
 * @return true if some move sequence reaches the goal.
 * @throws std::invalid_argument if side_length does not match the state.
 */
bool is_solvable(int side_length, const State& state);

#endif // __SOLVABILITY_HPP___
