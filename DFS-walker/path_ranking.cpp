#include <algorithm>
#include <vector>
#include "grid.hpp"
#include "maze_errors.hpp"

#include "path_ranking.hpp"

std::vector<Path> rank_paths(std::vector<Path> paths) {
    if (paths.empty()) {
        throw EmptyPathSet();
    }
    std::stable_sort(paths.begin(), paths.end(), [](const Path &a, const Path &b) {
        return a.size() < b.size();
    });
    return paths;
}

const Path& shortest_path(const std::vector<Path>& ranked) {
    if (ranked.empty()) {
        throw EmptyPathSet();
    }
    return ranked.front();
}

const Path& longest_path(const std::vector<Path>& ranked) {
    if (ranked.empty()) {
        throw EmptyPathSet();
    }
    return ranked.back();
}
