#ifndef __MAZE_REPORT_HPP___
#define __MAZE_REPORT_HPP___

#include <cstddef>
#include <ostream>
#include <string>

#include "grid.hpp"

/**
 * @file maze_report.hpp
 * @brief Result of walking a maze and its plain-text rendering.
 */

/**
 * @brief Summary of a successful walk.
 * @var path_count Number of distinct paths to an exit.
 * @var shortest Path with the fewest steps (first found among equals).
 * @var longest Path with the most steps (last found among equals).
 */
struct MazeReport {
    size_t path_count = 0;
    Path shortest;
    Path longest;
};

/**
 * @brief Render a path as "(r c) (r c) ...".
 */
std::string format_path(const Path& path);

/**
 * @brief Print the report in the walker's five-line text format.
 */
void format_report(const MazeReport& report, std::ostream& out);

#endif // __MAZE_REPORT_HPP___
