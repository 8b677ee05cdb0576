#ifndef __MAZE_ERRORS_HPP___
#define __MAZE_ERRORS_HPP___

#include <stdexcept>
#include <string>

/**
 * @file maze_errors.hpp
 * @brief Exceptions raised while parsing and walking a maze.
 *
 * All of them end the run: the computation is deterministic, so the input
 * has to be fixed before trying again.
 */

/**
 * @brief Structural defect in the maze text (unequal rows, unknown symbol,
 * start marker count other than one, nothing to parse).
 */
class MalformedMaze : public std::invalid_argument {
public:
    explicit MalformedMaze(const std::string& what) : std::invalid_argument("Malformed maze: " + what) {}
};

/**
 * @brief The grid holds no start cell.
 */
class NoStartFound : public std::runtime_error {
public:
    NoStartFound() : std::runtime_error("No start position found in maze") {}
};

/**
 * @brief The search finished without reaching any exit.
 */
class EmptyPathSet : public std::runtime_error {
public:
    EmptyPathSet() : std::runtime_error("The maze has no path to an exit") {}
};

/**
 * @brief The search expanded more nodes than its budget allows.
 */
class SearchAborted : public std::runtime_error {
public:
    explicit SearchAborted(long long max_nodes)
        : std::runtime_error("Search aborted after " + std::to_string(max_nodes) + " nodes") {}
};

#endif // __MAZE_ERRORS_HPP___
