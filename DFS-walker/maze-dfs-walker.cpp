#include <stack>
#include <utility>
#include <vector>
#include "grid.hpp"
#include "moves.hpp"
#include "maze_errors.hpp"
#include "path_ranking.hpp"

#include "maze-dfs-walker.hpp"

namespace {

// One pending branch: its own snapshot, where it stands, and how it got there.
struct Frame {
    Grid grid;
    Coordinate position;
    Path steps;
};

}

std::vector<Path> enumerate_paths(const Grid &grid, const Coordinate &start,
                                  const SearchOptions &options, long long* visited_nodes) {
    std::vector<Path> paths;
    std::stack<Frame> frontier;
    frontier.push(Frame{grid, start, Path()});
    long long expanded = 0;

    while (!frontier.empty()) {
        Frame current = std::move(frontier.top());
        frontier.pop();

        if (options.max_nodes > 0 && expanded >= options.max_nodes) {
            throw SearchAborted(options.max_nodes);
        }
        expanded++;
        if (visited_nodes) {
            *visited_nodes = expanded;
        }

        current.steps.push_back(current.position);
        if (is_exit(current.grid, current.position)) {
            paths.push_back(std::move(current.steps));
            continue;
        }

        Grid marked = current.grid.set(current.position.row, current.position.col, Cell::Visited);
        // Pushed in reverse so Right is popped first.
        for (auto dir = ALL_DIRECTIONS.rbegin(); dir != ALL_DIRECTIONS.rend(); ++dir) {
            if (can_move(marked, current.position, *dir)) {
                frontier.push(Frame{marked, step(current.position, *dir), current.steps});
            }
        }
    }
    return paths;
}

MazeReport walk_maze(const Grid &grid, const SearchOptions &options, long long* visited_nodes) {
    Coordinate start = locate_start(grid);
    std::vector<Path> ranked = rank_paths(enumerate_paths(grid, start, options, visited_nodes));

    MazeReport report;
    report.path_count = ranked.size();
    report.shortest = shortest_path(ranked);
    report.longest = longest_path(ranked);
    return report;
}
