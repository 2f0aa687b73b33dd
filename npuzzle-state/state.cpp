#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

#include "state.hpp"

using namespace std;

char move_label(Move move) {
    return static_cast<char>(move);
}

string moves_to_string(const vector<Move>& moves) {
    string out;
    out.reserve(moves.size());
    for (Move mv : moves) out.push_back(move_label(mv));
    return out;
}

void State::init(const vector<int>& cells, int side_length) {
    if (cells.empty()) {
        throw invalid_argument("Cells array cannot be empty");
    }
    if (side_length < MIN_SIDE_LENGTH || side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("Side length must be between " + to_string(MIN_SIDE_LENGTH) +
                               " and " + to_string(MAX_SIDE_LENGTH) + ", got " + to_string(side_length));
    }
    int num_cells = side_length * side_length;
    if (static_cast<int>(cells.size()) != num_cells) {
        throw invalid_argument("Expected " + to_string(num_cells) + " cells, got " + to_string(cells.size()));
    }
    vector<bool> seen(num_cells, false);
    int blank = -1;
    for (int i = 0; i < num_cells; ++i) {
        int value = cells[i];
        if (value < 0 || value >= num_cells) {
            throw invalid_argument("Cell values must be in range [0," + to_string(num_cells - 1) + "]");
        }
        if (seen[value]) {
            throw invalid_argument("Duplicate cell value " + to_string(value));
        }
        seen[value] = true;
        if (value == 0) blank = i;
    }
    this->side_length = side_length;
    this->cells = cells;
    this->blank_index = blank;
}

State::State(const vector<int>& cells, int side_length) {
    init(cells, side_length);
}

State::State(const vector<int>& cells) {
    int side = static_cast<int>(lround(sqrt(static_cast<double>(cells.size()))));
    if (side * side != static_cast<int>(cells.size())) {
        throw invalid_argument("Cell count " + to_string(cells.size()) + " is not a perfect square");
    }
    init(cells, side);
}

State State::goal(int side_length) {
    if (side_length < MIN_SIDE_LENGTH || side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("Side length must be between " + to_string(MIN_SIDE_LENGTH) +
                               " and " + to_string(MAX_SIDE_LENGTH) + ", got " + to_string(side_length));
    }
    int num_cells = side_length * side_length;
    vector<int> cells(num_cells);
    for (int i = 0; i < num_cells - 1; ++i) cells[i] = i + 1;
    cells[num_cells - 1] = 0;
    return State(cells, side_length);
}

size_t State::hash() const {
    // FNV-1a over the cell values
    size_t h = 1469598103934665603ULL;
    h ^= static_cast<size_t>(side_length);
    h *= 1099511628211ULL;
    for (int v : cells) {
        h ^= static_cast<size_t>(v + 1);
        h *= 1099511628211ULL;
    }
    return h;
}

int State::get_side_length() const {
    return side_length;
}

int State::get_num_cells() const {
    return side_length * side_length;
}

const vector<int>& State::get_cells() const {
    return cells;
}

int State::at(int index) const {
    return cells[index];
}

int State::at(int row, int column) const {
    return cells[row * side_length + column];
}

int State::get_blank_index() const {
    return blank_index;
}

int State::get_blank_row() const {
    if (side_length == 0) {
        throw logic_error("Blank position of a default-constructed State");
    }
    return blank_index / side_length;
}

int State::get_blank_column() const {
    if (side_length == 0) {
        throw logic_error("Blank position of a default-constructed State");
    }
    return blank_index % side_length;
}

bool State::is_goal() const {
    int num_cells = side_length * side_length;
    if (num_cells == 0 || cells[num_cells - 1] != 0) return false;
    for (int i = 0; i < num_cells - 1; ++i) {
        if (cells[i] != i + 1) return false;
    }
    return true;
}

vector<pair<State, Move>> State::get_available_moves() const {
    vector<pair<State, Move>> moves;
    moves.reserve(4);
    int row = get_blank_row();
    int col = get_blank_column();
    // (offset, move, legal) in U, D, L, R order
    const struct { int offset; Move move; bool legal; } directions[] = {
        {-side_length, Move::Up, row > 0},
        {side_length, Move::Down, row < side_length - 1},
        {-1, Move::Left, col > 0},
        {1, Move::Right, col < side_length - 1},
    };
    for (const auto& dir : directions) {
        if (!dir.legal) continue;
        State next = *this;
        int neighbor_pos = blank_index + dir.offset;
        swap(next.cells[blank_index], next.cells[neighbor_pos]);
        next.blank_index = neighbor_pos;
        moves.emplace_back(std::move(next), dir.move);
    }
    return moves;
}

State State::apply_move(Move move) const {
    for (auto& mv : get_available_moves()) {
        if (mv.second == move) return mv.first;
    }
    throw invalid_argument(string("Illegal move '") + move_label(move) + "' for blank at row " +
                           to_string(get_blank_row()) + ", column " + to_string(get_blank_column()));
}

bool State::operator==(const State &rhs) const {
    return side_length == rhs.side_length && cells == rhs.cells;
}

bool State::operator!=(const State &rhs) const {
    return !(*this == rhs);
}

bool State::operator<(const State &rhs) const {
    if (side_length != rhs.side_length) return side_length < rhs.side_length;
    return cells < rhs.cells;
}

vector<pair<State, Move>> neighbors(int side_length, const State& state) {
    if (state.get_side_length() != side_length) {
        throw invalid_argument("State side length " + to_string(state.get_side_length()) +
                               " does not match n=" + to_string(side_length));
    }
    return state.get_available_moves();
}
