#include <iostream>
#include <random>
#include <chrono>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "maze_errors.hpp"
#include "maze-dfs-walker.hpp"
#include "generate_sample_maze.hpp"

using namespace std;

int main(int argc, char** argv) {
    int rows = 8;
    int cols = 8;
    int open_percent = 60;
    long long max_nodes = 5000000;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--rows" && i + 1 < argc) { rows = stoi(argv[++i]); }
            else if (a == "--cols" && i + 1 < argc) { cols = stoi(argv[++i]); }
            else if (a == "--open" && i + 1 < argc) { open_percent = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--max-nodes" && i + 1 < argc) { max_nodes = stoll(argv[++i]); }
            else if (a == "--help") {
                cout << "Usage: benchmark-dfs [--rows R] [--cols C] [--open P] [--seed S] [--max-nodes N]\n";
                return 0;
            }
        }
    } catch (const std::logic_error& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 1;
    }

    mt19937 rng(seed);

    Grid maze;
    try {
        maze = random_maze(rows, cols, open_percent, rng);
    } catch (const std::exception& e) {
        cerr << "Error generating random maze: " << e.what() << '\n';
        return 4;
    }

    // CSV header
    cout << "rows,cols,open_percent,seed,time_ms,found,path_count,shortest,longest,visited_nodes" << '\n';

    SearchOptions options;
    options.max_nodes = max_nodes;
    long long visited_nodes = 0;
    MazeReport report;
    bool found = true;

    auto t0 = chrono::steady_clock::now();
    try {
        report = walk_maze(maze, options, &visited_nodes);
    } catch (const EmptyPathSet&) {
        found = false;
    } catch (const SearchAborted& e) {
        cerr << e.what() << " (seed " << seed << ")" << '\n';
        return 5;
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    cout << rows << ',' << cols << ',' << open_percent << ',' << seed << ',' << ms << ','
         << (found ? 1 : 0) << ',' << report.path_count << ','
         << report.shortest.size() << ',' << report.longest.size() << ',' << visited_nodes << '\n';

    return 0;
}
