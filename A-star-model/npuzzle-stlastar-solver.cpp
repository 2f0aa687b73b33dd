#include <memory>
#include <vector>

#include <stlastar.h>

#include "state.hpp"
#include "distance.hpp"
#include "npuzzle-stlastar-solver.hpp"

// Node pool handed to the library; the search reports out-of-memory beyond it.
static const int STLASTAR_MAX_NODES = 200000;

// Puzzle state type that implements the A* user-state interface
class PuzzleAStarState {
public:
    PuzzleAStarState() = default;
    PuzzleAStarState(const State &s, std::shared_ptr<const GoalPositions> goal_positions)
        : puzzle_state_(s), goal_positions_(std::move(goal_positions)) {
    }
    ~PuzzleAStarState() = default;

    // AStarState interface
    float GoalDistanceEstimate(PuzzleAStarState &nodeGoal);
    bool IsGoal(PuzzleAStarState &nodeGoal);
    bool GetSuccessors(AStarSearch<PuzzleAStarState> *astarsearch, PuzzleAStarState *parent_node);
    float GetCost(PuzzleAStarState &successor);
    bool IsSameState(PuzzleAStarState &rhs);
    size_t Hash();

    const State& to_state() const;

private:
    State puzzle_state_;
    std::shared_ptr<const GoalPositions> goal_positions_;
};

float PuzzleAStarState::GoalDistanceEstimate(PuzzleAStarState &nodeGoal) {
    return static_cast<float>(heuristic(puzzle_state_.get_side_length(), puzzle_state_, *goal_positions_));
}

bool PuzzleAStarState::IsGoal(PuzzleAStarState &nodeGoal) {
    return IsSameState(nodeGoal);
}

bool PuzzleAStarState::GetSuccessors(AStarSearch<PuzzleAStarState> *astarsearch, PuzzleAStarState *parent_node) {
    for (auto &mv : puzzle_state_.get_available_moves()) {
        // skip undoing the move that produced this node
        if (parent_node && parent_node->puzzle_state_ == mv.first) continue;
        PuzzleAStarState tmp(mv.first, goal_positions_);
        if (!astarsearch->AddSuccessor(tmp)) return false;
    }
    return true;
}

float PuzzleAStarState::GetCost(PuzzleAStarState &successor) {
    return 1.0f;
}

bool PuzzleAStarState::IsSameState(PuzzleAStarState &rhs) {
    return puzzle_state_ == rhs.puzzle_state_;
}

size_t PuzzleAStarState::Hash() {
    return puzzle_state_.hash();
}

const State& PuzzleAStarState::to_state() const {
    return puzzle_state_;
}

std::vector<State> PuzzleSolveAstar(const State &start, int* visited_nodes) {
    int side_length = start.get_side_length();
    auto goal_positions = std::make_shared<const GoalPositions>(build_goal_positions(side_length));
    PuzzleAStarState sstart(start, goal_positions);
    PuzzleAStarState sgoal(State::goal(side_length), goal_positions);

    AStarSearch<PuzzleAStarState> search_(STLASTAR_MAX_NODES);
    search_.SetStartAndGoalStates(sstart, sgoal);

    unsigned int result = 0;
    do {
        result = search_.SearchStep();
    } while (result == AStarSearch<PuzzleAStarState>::SEARCH_STATE_SEARCHING);

    std::vector<State> path;
    if (result == AStarSearch<PuzzleAStarState>::SEARCH_STATE_SUCCEEDED) {
        PuzzleAStarState *p = search_.GetSolutionStart();
        while (p) {
            path.push_back(p->to_state());
            p = search_.GetSolutionNext();
        }
        search_.FreeSolutionNodes();
    }

    if (visited_nodes) {
        *visited_nodes = search_.GetStepCount();
    }
    return path;
}
