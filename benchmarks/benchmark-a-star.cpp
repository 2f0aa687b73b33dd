#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <string>

#include "state.hpp"
#include "npuzzle-a-star-solver.hpp"
#include "npuzzle-bfs-solver.hpp"
#include "npuzzle-stlastar-solver.hpp"
#include "generate_sample_state.hpp"

using namespace std;

struct SolverRun {
    string solver;
    double time_ms;
    int moves;
    long long expanded;
    size_t max_frontier;
};

static double elapsed_ms(chrono::steady_clock::time_point t0) {
    auto t1 = chrono::steady_clock::now();
    return chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();
}

static void print_usage() {
    cout << "Usage: benchmark-a-star [--side N] [--depth D] [--instances K] [--seed S]\n";
}

static vector<SolverRun> run_all(const State& start) {
    vector<SolverRun> runs;
    int n = start.get_side_length();

    SearchResult informed = astar(n, start, true);
    runs.push_back({"astar", informed.elapsed_seconds * 1000.0, informed.moves, informed.expanded, informed.max_frontier});

    SearchResult ucs = astar(n, start, false);
    runs.push_back({"ucs", ucs.elapsed_seconds * 1000.0, ucs.moves, ucs.expanded, ucs.max_frontier});

    auto t0 = chrono::steady_clock::now();
    long long bfs_visited = 0;
    vector<State> bfs_path = bfs_solve(start, &bfs_visited);
    runs.push_back({"bfs", elapsed_ms(t0), static_cast<int>(bfs_path.size()) - 1, bfs_visited, 0});

    t0 = chrono::steady_clock::now();
    int stl_visited = 0;
    vector<State> stl_path = PuzzleSolveAstar(start, &stl_visited);
    runs.push_back({"stlastar", elapsed_ms(t0), static_cast<int>(stl_path.size()) - 1, stl_visited, 0});

    return runs;
}

int main(int argc, char** argv) {
    int side_size = 3;
    int depth = 20;
    int instances = 5;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--side" && i + 1 < argc) { side_size = stoi(argv[++i]); }
        else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
        else if (a == "--instances" && i + 1 < argc) { instances = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--help") {
            print_usage();
            return 0;
        } else {
            cerr << "Unknown argument: " << a << '\n';
            print_usage();
            return 1;
        }
    }

    if (side_size < MIN_SIDE_LENGTH || side_size > MAX_SIDE_LENGTH) {
        cerr << "side must be in [" << MIN_SIDE_LENGTH << "," << MAX_SIDE_LENGTH << "]\n";
        return 3;
    }

    mt19937 rng(seed);
    bool mismatch = false;

    // CSV header
    cout << "side,depth,instance_id,seed,solver,time_ms,moves,expanded,max_frontier" << '\n';

    for (int instance = 0; instance < instances; ++instance) {
        State start = random_state_random_walk(side_size, depth, rng);
        vector<SolverRun> runs;
        try {
            runs = run_all(start);
        } catch (const std::exception& e) {
            cerr << "Error solving instance " << instance << ": " << e.what() << '\n';
            return 4;
        }
        for (const auto& run : runs) {
            cout << side_size << ',' << depth << ',' << instance << ',' << seed << ',' << run.solver << ','
                 << run.time_ms << ',' << run.moves << ',' << run.expanded << ',' << run.max_frontier << '\n';
            if (run.moves != runs.front().moves) {
                cerr << "instance " << instance << ": " << run.solver << " found " << run.moves
                     << " moves, astar found " << runs.front().moves << '\n';
                mismatch = true;
            }
        }
    }

    return mismatch ? 5 : 0;
}
