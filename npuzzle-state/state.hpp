/**
 * @file state.hpp
 * @brief N-puzzle state representation (cells in row-major order, one blank).
 *
 * This header declares the State class and the Move label used across the
 * solvers and tools.
 */

#ifndef __STATE_HPP___
#define __STATE_HPP___

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace std;

const int MIN_SIDE_LENGTH = 3;
const int MAX_SIDE_LENGTH = 8;

/**
 * @brief Direction the blank travels in a single move.
 */
enum class Move : char {
    Up = 'U',
    Down = 'D',
    Left = 'L',
    Right = 'R'
};

/**
 * @brief Single-letter label of a move (U, D, L or R).
 */
char move_label(Move move);

/**
 * @brief Concatenate the labels of a move sequence, e.g. "RDLU".
 */
string moves_to_string(const vector<Move>& moves);

/**
 * @brief Represents a board state for the sliding-tile puzzle.
 *
 * The class stores the cell values in row-major order (0 is the blank,
 * 1..n*n-1 are tiles) together with the side length. Instances are never
 * modified after construction; moves produce new states.
 */
class State {

private:
    vector<int> cells;
    int side_length = 0;
    int blank_index = 0;
    void init(const vector<int>& cells, int side_length);
public:
    /**
     * @brief Empty placeholder (side length 0) meant only to be assigned over.
     *
     * Blank queries and move generation on it throw std::logic_error.
     */
    State() = default;
    /**
     * @brief Construct a State using inferred side length (square) from cell count.
     *
     * @param cells Cell values in row-major order (length = side*side).
     * @throws std::invalid_argument on inconsistent input.
     */
    explicit State(const vector<int>& cells);

    /**
     * @brief Construct a State with explicit side length.
     *
     * @param cells Cell values in row-major order.
     * @param side_length Board side length (3..8).
     * @throws std::invalid_argument if the cells are not a permutation of
     *         0..side_length*side_length-1 or the side length is out of range.
     */
    State(const vector<int>& cells, int side_length);
    ~State() = default;

    /**
     * @brief The canonical solved arrangement: 1..n*n-1 in row-major order, blank last.
     */
    static State goal(int side_length);

    /**
     * @brief Compute a stable hash for this state.
     *
     * The hash is suitable for use in unordered containers.
     * @return A size_t hash value.
     */
    size_t hash() const;

    // Rule of five
    State(const State& other) = default;
    State& operator=(const State& other) = default;
    State(State&& other) = default;
    State& operator=(State&& other) = default;

    int get_side_length() const;
    int get_num_cells() const;
    const vector<int>& get_cells() const;

    /**
     * @brief Value stored at the given row-major position.
     */
    int at(int index) const;
    int at(int row, int column) const;

    /**
     * @brief Row-major index of the blank cell.
     */
    int get_blank_index() const;
    /**
     * @throws std::logic_error on a default-constructed State.
     */
    int get_blank_row() const;
    int get_blank_column() const;

    bool is_goal() const;

    /**
     * @brief Generate all legal successor states from this state.
     *
     * Successors are returned in the fixed order U, D, L, R (only the legal
     * ones). Each successor differs from this state by exactly one swap of
     * the blank with an adjacent cell; the move names the direction the blank
     * travelled.
     *
     * @return Vector of (successor, move) pairs, 2 to 4 entries.
     */
    vector<pair<State, Move>> get_available_moves() const;

    /**
     * @brief Apply one move to a copy of this state.
     *
     * @throws std::invalid_argument if the blank cannot travel in that direction.
     */
    State apply_move(Move move) const;

    /**
     * @brief Equality comparison between two states (same side and cell layout).
     */
    bool operator==(const State &rhs) const;
    bool operator!=(const State &rhs) const;

    /**
     * @brief Strict weak ordering used for ordered containers (std::set).
     */
    bool operator<(const State &rhs) const;
};

/**
 * @brief Hash functor so State can key std::unordered_map / std::unordered_set.
 */
struct StateHasher {
    size_t operator()(const State& state) const {
        return state.hash();
    }
};

/**
 * @brief Free-function form of State::get_available_moves.
 *
 * @param side_length Board side length; must match the state's.
 * @param state State to expand.
 * @return (successor, move) pairs in the order U, D, L, R.
 */
vector<pair<State, Move>> neighbors(int side_length, const State& state);

#endif // __STATE_HPP___
