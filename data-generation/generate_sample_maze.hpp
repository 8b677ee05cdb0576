#ifndef __GENERATE_SAMPLE_MAZE_HPP___
#define __GENERATE_SAMPLE_MAZE_HPP___

#include <random>

#include "grid.hpp"

/**
 * @file generate_sample_maze.hpp
 * @brief Utilities to create random mazes for benchmarks and testing.
 */

/**
 * @brief Generate a random maze with a single start cell.
 *
 * Every cell is independently open with probability `open_percent`/100 and
 * blocked otherwise. The start is then placed on a uniformly chosen
 * interior cell, or on any cell when the grid has no interior (fewer than
 * three rows or columns). The result always parses back with parse_maze().
 *
 * @param rows Number of rows (> 0).
 * @param cols Number of columns (> 0).
 * @param open_percent Chance of a cell being open, in [0,100].
 * @param rng Random number generator to use (std::mt19937).
 * @throws std::invalid_argument on non-positive dimensions or a percentage out of range.
 * @return A sampled `Grid`.
 */
Grid random_maze(int rows, int cols, int open_percent, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_MAZE_HPP___
