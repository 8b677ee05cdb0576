#ifndef __MAZE_DFS_WALKER_HPP___
#define __MAZE_DFS_WALKER_HPP___

#include <vector>

#include "grid.hpp"
#include "maze_report.hpp"

/**
 * @file maze-dfs-walker.hpp
 * @brief Exhaustive depth-first enumeration of all simple paths out of a maze.
 */

/**
 * @brief Limits applied to a single search.
 * @var max_nodes Maximum number of expanded nodes, 0 for no limit.
 */
struct SearchOptions {
    long long max_nodes = 0;
};

/**
 * @brief Enumerate every simple path from `start` to a boundary cell.
 *
 * Each branch of the search owns its own grid snapshot, with the cells it
 * has stepped on marked Visited, so sibling branches never see each
 * other's marks. Directions are tried in the order Right, Up, Left, Down
 * and paths are returned in the order that exploration discovers them.
 * A start on the boundary yields the single path {start}; a start with no
 * way out yields an empty vector.
 *
 * The traversal uses an explicit stack, so maze size is not bounded by the
 * call stack.
 *
 * @param grid Maze in its initial state.
 * @param start Start coordinate (usually from locate_start()).
 * @param options Search limits.
 * @param visited_nodes Optional out-parameter to receive number of expanded nodes.
 * @throws SearchAborted if options.max_nodes is exceeded.
 * @return All paths, each running from start to an exit inclusive.
 */
std::vector<Path> enumerate_paths(const Grid &grid, const Coordinate &start,
                                  const SearchOptions &options = SearchOptions(),
                                  long long* visited_nodes = nullptr);

/**
 * @brief Locate the start, enumerate all paths and rank them.
 *
 * @param grid Maze in its initial state.
 * @param options Search limits.
 * @param visited_nodes Optional out-parameter to receive number of expanded nodes.
 * @throws NoStartFound, EmptyPathSet, SearchAborted
 * @return Path count plus the shortest and longest paths.
 */
MazeReport walk_maze(const Grid &grid, const SearchOptions &options = SearchOptions(),
                     long long* visited_nodes = nullptr);

#endif // __MAZE_DFS_WALKER_HPP___
