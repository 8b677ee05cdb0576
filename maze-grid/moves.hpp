#ifndef __MOVES_HPP___
#define __MOVES_HPP___

#include <array>

#include "grid.hpp"

/**
 * @file moves.hpp
 * @brief Exit detection and legal-move checks on a maze grid.
 */

/**
 * @brief Step directions, in the order the walker explores them.
 */
enum class Direction {
    Right,
    Up,
    Left,
    Down
};

/**
 * @brief All directions in exploration order (Right, Up, Left, Down).
 *
 * The order decides which of two equally long paths is reported first.
 */
constexpr std::array<Direction, 4> ALL_DIRECTIONS = {
    Direction::Right, Direction::Up, Direction::Left, Direction::Down
};

/**
 * @brief Coordinate one step away from `coord` in direction `dir` (no bounds check).
 */
Coordinate step(const Coordinate& coord, Direction dir);

/**
 * @brief Whether the coordinate lies on the outer boundary of the grid.
 *
 * @param grid Grid giving the dimensions.
 * @param coord Coordinate to test.
 * @return true on the first/last row or the first/last column.
 */
bool is_exit(const Grid& grid, const Coordinate& coord);

/**
 * @brief Whether a single step from `coord` in direction `dir` is legal.
 *
 * The target must be inside the grid and still Open. Start and Visited
 * cells are never valid targets, which keeps every path simple.
 *
 * @param grid Current snapshot.
 * @param coord Position to move from.
 * @param dir Direction of the step.
 */
bool can_move(const Grid& grid, const Coordinate& coord, Direction dir);

#endif // __MOVES_HPP___
