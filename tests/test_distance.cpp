// Google Test for the Manhattan + linear conflict heuristic
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <cstdlib>

#include "state.hpp"
#include "distance.hpp"
#include "generate_sample_state.hpp"

class DistanceTest : public ::testing::Test {
protected:
    const int n = 3;
    GoalPositions goal_pos = build_goal_positions(3);
};

TEST(GoalPositionsTest, Layout) {
    GoalPositions pos = build_goal_positions(4);
    ASSERT_EQ(pos.size(), 16u);
    EXPECT_EQ(pos[0].row, 3);
    EXPECT_EQ(pos[0].column, 3);
    EXPECT_EQ(pos[1].row, 0);
    EXPECT_EQ(pos[1].column, 0);
    EXPECT_EQ(pos[6].row, 1);
    EXPECT_EQ(pos[6].column, 1);
    EXPECT_EQ(pos[15].row, 3);
    EXPECT_EQ(pos[15].column, 2);
    EXPECT_THROW(build_goal_positions(2), std::invalid_argument);
}

TEST_F(DistanceTest, GoalIsZero) {
    State goal = State::goal(n);
    EXPECT_EQ(manhattan_distance(n, goal, goal_pos), 0);
    EXPECT_EQ(linear_conflict(n, goal, goal_pos), 0);
    EXPECT_EQ(heuristic(n, goal, goal_pos), 0);
}

TEST(DistanceGoalTest, GoalIsZeroForAllSides) {
    for (int side = 3; side <= 8; ++side) {
        EXPECT_EQ(heuristic(side, State::goal(side), build_goal_positions(side)), 0) << "side " << side;
    }
}

TEST_F(DistanceTest, HeuristicPositive) {
    State board({1, 2, 3, 4, 5, 6, 0, 7, 8}, 3);
    EXPECT_EQ(manhattan_distance(n, board, goal_pos), 2);
    EXPECT_EQ(linear_conflict(n, board, goal_pos), 0);
    EXPECT_GT(heuristic(n, board, goal_pos), 0);
}

TEST_F(DistanceTest, LinearConflictDetectsRowReversal) {
    // Tiles 1 and 2 reversed in top row -> one conflict adds 2
    State board({2, 1, 3,
                 4, 5, 6,
                 7, 8, 0}, 3);
    EXPECT_EQ(linear_conflict(n, board, goal_pos), 2);
    EXPECT_EQ(manhattan_distance(n, board, goal_pos), 2);
    EXPECT_EQ(heuristic(n, board, goal_pos), 4);
}

TEST_F(DistanceTest, LinearConflictDetectsColumnReversal) {
    // Tiles 1 and 4 reversed in the first column
    State board({4, 2, 3,
                 1, 5, 6,
                 7, 8, 0}, 3);
    EXPECT_EQ(linear_conflict(n, board, goal_pos), 2);
    EXPECT_EQ(manhattan_distance(n, board, goal_pos), 2);
}

TEST_F(DistanceTest, LinearConflictCountsEveryReversedPair) {
    State board({3, 2, 1,
                 4, 5, 6,
                 7, 8, 0}, 3);
    EXPECT_EQ(linear_conflict(n, board, goal_pos), 6);
}

TEST_F(DistanceTest, TilesOutsideTheirGoalLineDoNotConflict) {
    // 7 and 8 are reversed but neither sits in its goal row or column
    State board({1, 2, 3,
                 8, 7, 6,
                 4, 5, 0}, 3);
    EXPECT_EQ(linear_conflict(n, board, goal_pos), 0);
}

TEST_F(DistanceTest, MismatchedTableThrows) {
    EXPECT_THROW(manhattan_distance(4, State::goal(4), goal_pos), std::invalid_argument);
    EXPECT_THROW(linear_conflict(n, State::goal(4), goal_pos), std::invalid_argument);
}

TEST(DistancePropertyTest, NonNegativeAndConsistentAcrossMoves) {
    std::mt19937 rng(2024);
    for (int side = 3; side <= 5; ++side) {
        GoalPositions pos = build_goal_positions(side);
        for (int i = 0; i < 20; ++i) {
            State s = random_state_random_walk(side, 30, rng);
            int h = heuristic(side, s, pos);
            EXPECT_GE(manhattan_distance(side, s, pos), 0);
            EXPECT_GE(linear_conflict(side, s, pos), 0);
            EXPECT_EQ(h == 0, s.is_goal());
            for (const auto &mv : s.get_available_moves()) {
                int step = manhattan_distance(side, mv.first, pos) - manhattan_distance(side, s, pos);
                EXPECT_EQ(std::abs(step), 1);
            }
        }
    }
}
