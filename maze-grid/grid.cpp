#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

#include "grid.hpp"
#include "maze_errors.hpp"

using namespace std;

void Grid::init(const vector<Cell>& cells, int rows, int cols) {
    if (rows <= 0 || cols <= 0) {
        throw invalid_argument("Grid must have at least one row and one column");
    }
    if (cells.size() != static_cast<size_t>(rows) * static_cast<size_t>(cols)) {
        throw invalid_argument("Cell count does not match grid dimensions");
    }
    this->cells = cells;
    this->row_count = rows;
    this->col_count = cols;
}

Grid::Grid(const vector<Cell>& cells, int rows, int cols) {
    init(cells, rows, cols);
}

Grid::Grid(const vector<vector<Cell>>& rows) {
    if (rows.empty()) {
        throw invalid_argument("Grid must have at least one row");
    }
    size_t width = rows.front().size();
    vector<Cell> flat;
    flat.reserve(rows.size() * width);
    for (const auto &row : rows) {
        if (row.size() != width) {
            throw invalid_argument("All grid rows must have the same length");
        }
        flat.insert(flat.end(), row.begin(), row.end());
    }
    init(flat, static_cast<int>(rows.size()), static_cast<int>(width));
}

int Grid::rows() const {
    return row_count;
}

int Grid::cols() const {
    return col_count;
}

bool Grid::in_bounds(int row, int col) const {
    return row >= 0 && row < row_count && col >= 0 && col < col_count;
}

Cell Grid::get(int row, int col) const {
    if (!in_bounds(row, col)) {
        throw out_of_range("Cell (" + to_string(row) + ", " + to_string(col) + ") is outside the grid");
    }
    return cells[row * col_count + col];
}

Grid Grid::set(int row, int col, Cell cell) const {
    if (!in_bounds(row, col)) {
        throw out_of_range("Cell (" + to_string(row) + ", " + to_string(col) + ") is outside the grid");
    }
    Grid updated(*this);
    updated.cells[row * col_count + col] = cell;
    return updated;
}

size_t Grid::count(Cell cell) const {
    return static_cast<size_t>(std::count(cells.begin(), cells.end(), cell));
}

bool Grid::operator==(const Grid &rhs) const {
    return row_count == rhs.row_count && col_count == rhs.col_count && cells == rhs.cells;
}

Coordinate locate_start(const Grid& grid) {
    for (int row = 0; row < grid.rows(); ++row) {
        for (int col = 0; col < grid.cols(); ++col) {
            if (grid.get(row, col) == Cell::Start) {
                return Coordinate{row, col};
            }
        }
    }
    throw NoStartFound();
}
