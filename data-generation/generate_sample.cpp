#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "maze_file_operations.hpp"
#include "generate_sample_maze.hpp"

using namespace std;

int main(int argc, char** argv) {
    int rows = 6;
    int cols = 6;
    int open_percent = 60;
    unsigned int seed = 0;
    string output_file = "maze.txt";

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--rows" && i + 1 < argc) { rows = stoi(argv[++i]); }
            else if (a == "--cols" && i + 1 < argc) { cols = stoi(argv[++i]); }
            else if (a == "--open" && i + 1 < argc) { open_percent = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate_sample_maze [--rows R] [--cols C] [--open P] [--seed S] [--output-file FILE]\n";
                return 0;
            }
        }
    } catch (const std::logic_error& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 1;
    }

    mt19937 rng(seed);
    try {
        Grid sample = random_maze(rows, cols, open_percent, rng);
        write_maze_to_file(sample, output_file);
    } catch (const std::exception& e) {
        cerr << "Error generating maze: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
