#ifndef __PATH_RANKING_HPP___
#define __PATH_RANKING_HPP___

#include <vector>

#include "grid.hpp"

/**
 * @file path_ranking.hpp
 * @brief Ordering of enumerated paths by length.
 */

/**
 * @brief Sort paths by ascending number of steps.
 *
 * The sort is stable: paths of equal length keep the order in which the
 * walker found them. The paths themselves are not modified.
 *
 * @param paths Paths as returned by enumerate_paths().
 * @throws EmptyPathSet if `paths` is empty.
 * @return Ranked copy of `paths`.
 */
std::vector<Path> rank_paths(std::vector<Path> paths);

/**
 * @brief First path of a ranked collection.
 * @throws EmptyPathSet if `ranked` is empty.
 */
const Path& shortest_path(const std::vector<Path>& ranked);

/**
 * @brief Last path of a ranked collection.
 * @throws EmptyPathSet if `ranked` is empty.
 */
const Path& longest_path(const std::vector<Path>& ranked);

#endif // __PATH_RANKING_HPP___
