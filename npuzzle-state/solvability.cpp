#include <stdexcept>
#include <string>

#include "state.hpp"
#include "solvability.hpp"

using namespace std;

long long inversion_count(const State& state) {
    vector<int> tiles;
    tiles.reserve(state.get_num_cells());
    for (int v : state.get_cells()) {
        if (v != 0) tiles.push_back(v);
    }
    long long inversions = 0;
    for (size_t i = 0; i < tiles.size(); ++i) {
        for (size_t j = i + 1; j < tiles.size(); ++j) {
            if (tiles[i] > tiles[j]) ++inversions;
        }
    }
    return inversions;
}

bool is_solvable(int side_length, const State& state) {
    if (state.get_side_length() != side_length) {
        throw invalid_argument("State side length " + to_string(state.get_side_length()) +
                               " does not match n=" + to_string(side_length));
    }
    long long inversions = inversion_count(state);
    if (side_length % 2 == 1) {
        return inversions % 2 == 0;
    }
    int blank_row_from_bottom = side_length - state.get_blank_row();
    if (blank_row_from_bottom % 2 == 0) {
        return inversions % 2 == 1;
    }
    return inversions % 2 == 0;
}
