// Google Test for the A* / uniform-cost solver and the BFS baseline
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>

#include "state.hpp"
#include "solvability.hpp"
#include "npuzzle-a-star-solver.hpp"
#include "npuzzle-bfs-solver.hpp"
#include "generate_sample_state.hpp"

static void expect_valid_path(const State& start, const SearchResult& result) {
    ASSERT_EQ(result.path.size(), static_cast<size_t>(result.moves));
    ASSERT_EQ(result.boards.size(), result.path.size() + 1);
    EXPECT_EQ(result.boards.front(), start);
    EXPECT_TRUE(result.boards.back().is_goal());

    State replay = start;
    for (size_t i = 0; i < result.path.size(); ++i) {
        replay = replay.apply_move(result.path[i]);
        EXPECT_EQ(replay, result.boards[i + 1]) << "step " << i + 1;
    }
    EXPECT_EQ(replay, State::goal(start.get_side_length()));
}

TEST(PuzzleSolver, AlreadySolved) {
    State start = State::goal(3);
    SearchResult result = astar(3, start);

    EXPECT_EQ(result.moves, 0);
    EXPECT_TRUE(result.path.empty());
    ASSERT_EQ(result.boards.size(), 1u);
    EXPECT_EQ(result.boards[0], start);
    EXPECT_EQ(result.expanded, 0);
    EXPECT_EQ(result.max_frontier, 0u);
    EXPECT_EQ(result.elapsed_seconds, 0.0);
}

TEST(PuzzleSolver, OneMoveSolution) {
    State start({1, 2, 3,
                 4, 5, 6,
                 7, 0, 8}, 3);
    SearchResult result = astar(3, start);

    EXPECT_EQ(result.moves, 1);
    ASSERT_EQ(result.path.size(), 1u);
    EXPECT_EQ(result.path[0], Move::Right);
    EXPECT_EQ(moves_to_string(result.path), "R");
    expect_valid_path(start, result);

    // start, then the goal ahead of the two other children
    EXPECT_EQ(result.expanded, 2);
    EXPECT_EQ(result.max_frontier, 2u);
}

TEST(PuzzleSolver, UniformCostTieBreakIsDeterministic) {
    State start({1, 2, 3,
                 4, 5, 6,
                 7, 0, 8}, 3);
    SearchResult result = astar(3, start, false);

    EXPECT_EQ(result.moves, 1);
    EXPECT_EQ(moves_to_string(result.path), "R");
    // all depth-1 children tie on (f, h, g); they pop in cell order.
    // Frontier sizes taken right after each pop: 0, 2, 4, 4.
    EXPECT_EQ(result.expanded, 4);
    EXPECT_EQ(result.max_frontier, 4u);
}

TEST(PuzzleSolver, ExpansionStatisticsArePinned) {
    State start({8, 6, 7,
                 2, 4, 3,
                 5, 0, 1}, 3);
    ASSERT_TRUE(is_solvable(3, start));
    SearchResult result = astar(3, start, true);

    EXPECT_EQ(result.moves, 29);
    EXPECT_EQ(result.expanded, 2630);
    EXPECT_EQ(result.max_frontier, 1506u);
    expect_valid_path(start, result);
}

TEST(PuzzleSolver, SolutionReachesGoal) {
    State start({1, 2, 3,
                 4, 0, 6,
                 7, 5, 8}, 3);
    SearchResult result = astar(3, start);

    EXPECT_EQ(result.moves, 2);
    EXPECT_EQ(moves_to_string(result.path), "DR");
    EXPECT_EQ(result.boards.back(), State::goal(3));
    expect_valid_path(start, result);
}

TEST(PuzzleSolver, HardestEightPuzzle) {
    State start({8, 6, 7,
                 2, 5, 4,
                 3, 0, 1}, 3);
    ASSERT_TRUE(is_solvable(3, start));

    SearchResult informed = astar(3, start, true);
    SearchResult ucs = astar(3, start, false);

    EXPECT_EQ(informed.moves, 31);
    EXPECT_EQ(ucs.moves, 31);
    EXPECT_LE(informed.expanded, ucs.expanded);
    expect_valid_path(start, informed);
    expect_valid_path(start, ucs);
}

TEST(PuzzleSolver, HeuristicMatchesUniformCostOnRandomInstances) {
    std::mt19937 rng(42);
    for (int i = 0; i < 15; ++i) {
        State start = random_state_random_walk(3, 10 + i, rng);
        SearchResult informed = astar(3, start, true);
        SearchResult ucs = astar(3, start, false);

        EXPECT_EQ(informed.moves, ucs.moves) << "instance " << i;
        EXPECT_LE(informed.expanded, ucs.expanded) << "instance " << i;
        expect_valid_path(start, informed);
    }
}

TEST(PuzzleSolver, ExactDepthInstances) {
    std::mt19937 rng(7);
    for (int depth = 1; depth <= 16; depth += 3) {
        State start = random_state_bfs(3, depth, rng);
        SearchResult result = astar(3, start);
        EXPECT_EQ(result.moves, depth);
        expect_valid_path(start, result);
    }
}

TEST(PuzzleSolver, LargerBoards) {
    std::mt19937 rng(99);
    for (int side = 4; side <= 6; ++side) {
        State start = random_state_random_walk(side, 20, rng);
        SearchResult result = astar(side, start);
        EXPECT_LE(result.moves, 20) << "side " << side;
        EXPECT_EQ(result.moves % 2, 0) << "side " << side;
        expect_valid_path(start, result);
    }
}

TEST(PuzzleSolver, UnsolvableStartExhaustsFrontier) {
    State start({1, 2, 3,
                 4, 5, 6,
                 8, 7, 0}, 3);
    ASSERT_FALSE(is_solvable(3, start));
    EXPECT_THROW(astar(3, start), SearchExhaustedError);
}

TEST(PuzzleSolver, SideLengthMismatchThrows) {
    EXPECT_THROW(astar(4, State::goal(3)), std::invalid_argument);
}

TEST(BfsSolver, AgreesWithAstar) {
    std::mt19937 rng(5);
    for (int i = 0; i < 8; ++i) {
        State start = random_state_random_walk(3, 8 + 2 * i, rng);
        long long visited = 0;
        auto path = bfs_solve(start, &visited);
        SearchResult result = astar(3, start);

        ASSERT_FALSE(path.empty());
        EXPECT_EQ(path.front(), start);
        EXPECT_TRUE(path.back().is_goal());
        EXPECT_EQ(static_cast<int>(path.size()) - 1, result.moves);
        EXPECT_EQ(visited == 0, start.is_goal());
    }
}

TEST(BfsSolver, GoalStart) {
    long long visited = -1;
    auto path = bfs_solve(State::goal(3), &visited);
    ASSERT_EQ(path.size(), 1u);
    EXPECT_EQ(visited, 0);
}
