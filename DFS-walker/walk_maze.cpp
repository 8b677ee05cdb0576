#include <iostream>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "maze_errors.hpp"
#include "maze_file_operations.hpp"
#include "maze_report.hpp"
#include "maze-dfs-walker.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file = "maze.txt";
    SearchOptions options;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--max-nodes" && i + 1 < argc) {
            try {
                options.max_nodes = stoll(argv[++i]);
            } catch (const std::logic_error&) {
                cerr << "Error: --max-nodes expects an integer" << '\n';
                return 1;
            }
        }
        else if (a == "--help") {
            cout << "Usage: walk_maze [--input-file FILE] [--max-nodes N]\n";
            return 0;
        }
        else {
            cerr << "Error: unknown argument " << a << '\n';
            return 1;
        }
    }

    try {
        Grid maze = read_maze_from_file(input_file);
        MazeReport report = walk_maze(maze, options);
        format_report(report, cout);
    } catch (const MalformedMaze& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    } catch (const NoStartFound& e) {
        cerr << "Error: " << e.what() << '\n';
        return 3;
    } catch (const EmptyPathSet& e) {
        cerr << "Error: " << e.what() << '\n';
        return 4;
    } catch (const SearchAborted& e) {
        cerr << "Error: " << e.what() << '\n';
        return 5;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
