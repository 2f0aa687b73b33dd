#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "solvability.hpp"
#include "npuzzle-a-star-solver.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: npuzzle-solver FILE [--show] [--evaluation]\n"
         << "Solve an n-puzzle (n = 3..8) using A* (Manhattan + Linear Conflict).\n"
         << "  --show        Print boards along the solution path.\n"
         << "  --evaluation  Compare UCS (h = 0) with the A* heuristic.\n";
}

static void print_statistics(const SearchResult& result) {
    cout << "  Expanded states: " << result.expanded << '\n';
    cout << "  Max frontier size: " << result.max_frontier << '\n';
    cout << "  Runtime: " << fixed << setprecision(3) << result.elapsed_seconds << " seconds\n";
}

static void print_solution(const SearchResult& result, bool show) {
    cout << "Minimum moves: " << result.moves << '\n';
    cout << "Move sequence: " << moves_to_string(result.path) << '\n';
    if (show) {
        for (size_t i = 0; i < result.boards.size(); ++i) {
            cout << "\nStep " << i << ":\n";
            cout << format_board(result.boards[i]) << '\n';
        }
    }
}

static void run_solver(const string& file_path, bool show, bool evaluation) {
    State start = read_state_from_file(file_path);
    int n = start.get_side_length();

    cout << "n = " << n << '\n';
    cout << "Start:\n";
    cout << format_board(start) << "\n\n";

    if (!is_solvable(n, start)) {
        cout << "This puzzle configuration is NOT solvable." << endl;
        return;
    }

    if (evaluation) {
        cout << "Running Uniform Cost Search (h = 0)..." << endl;
        SearchResult ucs = astar(n, start, false);

        cout << "Running A* with heuristic..." << endl;
        SearchResult informed = astar(n, start, true);

        cout << "\n=== Evaluation Results ===\n";
        cout << "UCS (no heuristic):\n";
        print_statistics(ucs);

        cout << "\nA* with heuristic:\n";
        print_statistics(informed);

        cout << "\n=== Solution (A* with heuristic) ===\n";
        print_solution(informed, show);
    } else {
        print_solution(astar(n, start, true), show);
    }
}

int main(int argc, char** argv) {
    string input_file;
    bool show = false;
    bool evaluation = false;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--show") { show = true; }
        else if (a == "--evaluation") { evaluation = true; }
        else if (a == "--help" || a == "-h") {
            print_usage();
            return 0;
        }
        else if (!a.empty() && a[0] == '-') {
            cerr << "Unknown option: " << a << '\n';
            print_usage();
            return 1;
        }
        else if (input_file.empty()) { input_file = a; }
        else {
            cerr << "Unexpected argument: " << a << '\n';
            print_usage();
            return 1;
        }
    }
    if (input_file.empty()) {
        print_usage();
        return 1;
    }

    try {
        run_solver(input_file, show, evaluation);
    } catch (const SearchExhaustedError& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
