#ifndef __STATE_FILE_OPERATIONS_HPP___
#define __STATE_FILE_OPERATIONS_HPP___

#include <string>

#include "state.hpp"

/**
 * @file state_file_operations.hpp
 * @brief Read/write `State` values from plain-text grid files and format them for display.
 *
 * A puzzle file holds one grid row per non-blank line, so the number of
 * non-blank lines is the side length. Three layouts are accepted:
 * - tab-delimited, where an empty field is the blank;
 * - space-aligned columns, where the blank may be left out of one row and is
 *   recovered from the column offsets of a complete row;
 * - plain whitespace-separated numbers with the blank written as 0.
 */

/**
 * @brief Parse a `State` from the text of a puzzle file.
 *
 * @param text File contents.
 * @throws std::invalid_argument if the side length is outside 3..8, no layout
 *         matches, or the numbers are not exactly 0..n*n-1.
 * @return Constructed `State` instance.
 */
State parse_state(const std::string& text);

/**
 * @brief Read a `State` from a puzzle file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws std::invalid_argument if the contents cannot be parsed.
 * @return Constructed `State` instance.
 */
State read_state_from_file(const std::string& filename);

/**
 * @brief Write a `State` as a space-aligned grid with an explicit 0 for the blank.
 *
 * The output is accepted by read_state_from_file.
 *
 * @param state State to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_state_to_file(const State& state, const std::string& filename);

/**
 * @brief Render a board with right-aligned numbers; the blank is left empty.
 *
 * Every cell is as wide as the largest tile so columns line up.
 */
std::string format_board(const State& state);

#endif // __STATE_FILE_OPERATIONS_HPP___
