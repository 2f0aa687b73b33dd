#include <cstdlib>
#include <stdexcept>
#include <string>

#include "state.hpp"
#include "distance.hpp"

using namespace std;

static void check_dimensions(int side_length, const State& state, const GoalPositions& goal_positions) {
    int num_cells = side_length * side_length;
    if (state.get_side_length() != side_length) {
        throw invalid_argument("State side length " + to_string(state.get_side_length()) +
                               " does not match n=" + to_string(side_length));
    }
    if (goal_positions.size() != static_cast<size_t>(num_cells)) {
        throw invalid_argument("Goal position table size does not match number of cells in state");
    }
}

GoalPositions build_goal_positions(int side_length) {
    if (side_length < MIN_SIDE_LENGTH || side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("Side length must be between " + to_string(MIN_SIDE_LENGTH) +
                               " and " + to_string(MAX_SIDE_LENGTH) + ", got " + to_string(side_length));
    }
    int num_cells = side_length * side_length;
    GoalPositions positions(num_cells);
    for (int value = 1; value < num_cells; ++value) {
        positions[value] = GoalPosition{(value - 1) / side_length, (value - 1) % side_length};
    }
    positions[0] = GoalPosition{side_length - 1, side_length - 1};
    return positions;
}

int manhattan_distance(int side_length, const State& state, const GoalPositions& goal_positions) {
    check_dimensions(side_length, state, goal_positions);
    int distance = 0;
    int num_cells = side_length * side_length;
    for (int index = 0; index < num_cells; ++index) {
        int value = state.at(index);
        if (value == 0) continue;
        const GoalPosition& goal = goal_positions[value];
        distance += abs(index / side_length - goal.row) + abs(index % side_length - goal.column);
    }
    return distance;
}

int linear_conflict(int side_length, const State& state, const GoalPositions& goal_positions) {
    check_dimensions(side_length, state, goal_positions);
    int conflict = 0;
    vector<int> line;
    line.reserve(side_length);

    // rows: tiles already in their goal row, compared by goal column
    for (int row = 0; row < side_length; ++row) {
        line.clear();
        for (int col = 0; col < side_length; ++col) {
            int value = state.at(row, col);
            if (value != 0 && goal_positions[value].row == row) {
                line.push_back(goal_positions[value].column);
            }
        }
        for (size_t i = 0; i < line.size(); ++i) {
            for (size_t j = i + 1; j < line.size(); ++j) {
                if (line[i] > line[j]) conflict += 2;
            }
        }
    }

    // columns: tiles already in their goal column, compared by goal row
    for (int col = 0; col < side_length; ++col) {
        line.clear();
        for (int row = 0; row < side_length; ++row) {
            int value = state.at(row, col);
            if (value != 0 && goal_positions[value].column == col) {
                line.push_back(goal_positions[value].row);
            }
        }
        for (size_t i = 0; i < line.size(); ++i) {
            for (size_t j = i + 1; j < line.size(); ++j) {
                if (line[i] > line[j]) conflict += 2;
            }
        }
    }
    return conflict;
}

int heuristic(int side_length, const State& state, const GoalPositions& goal_positions) {
    return manhattan_distance(side_length, state, goal_positions) +
           linear_conflict(side_length, state, goal_positions);
}
