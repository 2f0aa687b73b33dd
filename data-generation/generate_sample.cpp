#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: generate-sample --side N --depth D [--seed S] [--method walk|bfs] --output-file PATH\n";
}

int main(int argc, char** argv) {
    int side_size = 3;
    int depth = 20;
    unsigned int seed = 0;
    string method = "walk";
    string output_file;

    try {
        // Simple argument parsing
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--side" && i + 1 < argc) { side_size = stoi(argv[++i]); }
            else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--method" && i + 1 < argc) { method = argv[++i]; }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                print_usage();
                return 0;
            } else {
                cerr << "Unknown argument: " << a << '\n';
                print_usage();
                return 1;
            }
        }
        if (output_file.empty() || depth < 0) {
            print_usage();
            return 1;
        }

        mt19937 rng(seed);
        State sample;
        if (method == "walk") {
            sample = random_state_random_walk(side_size, depth, rng);
        } else if (method == "bfs") {
            sample = random_state_bfs(side_size, depth, rng);
        } else {
            cerr << "Unknown method: " << method << '\n';
            return 1;
        }
        write_state_to_file(sample, output_file);
        cout << "Wrote " << side_size << "x" << side_size << " instance (" << method << ", depth "
             << depth << ", seed " << seed << ") to " << output_file << '\n';
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
