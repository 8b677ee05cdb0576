#include <random>
#include <stdexcept>
#include <vector>

#include "grid.hpp"
#include "generate_sample_maze.hpp"

using namespace std;

Grid random_maze(int rows, int cols, int open_percent, std::mt19937 &rng) {
    if (rows <= 0 || cols <= 0) {
        throw invalid_argument("Maze dimensions must be positive");
    }
    if (open_percent < 0 || open_percent > 100) {
        throw invalid_argument("open_percent must be in [0,100]");
    }

    uniform_int_distribution<int> percent(0, 99);
    vector<Cell> cells(static_cast<size_t>(rows) * cols);
    for (auto &cell : cells) {
        cell = percent(rng) < open_percent ? Cell::Open : Cell::Blocked;
    }

    int row_lo = 0, row_hi = rows - 1, col_lo = 0, col_hi = cols - 1;
    if (rows >= 3 && cols >= 3) {
        row_lo = 1; row_hi = rows - 2;
        col_lo = 1; col_hi = cols - 2;
    }
    uniform_int_distribution<int> start_row(row_lo, row_hi);
    uniform_int_distribution<int> start_col(col_lo, col_hi);
    int r = start_row(rng);
    int c = start_col(rng);

    return Grid(cells, rows, cols).set(r, c, Cell::Start);
}
