#include "grid.hpp"
#include "moves.hpp"

using namespace std;

Coordinate step(const Coordinate& coord, Direction dir) {
    switch (dir) {
        case Direction::Right: return Coordinate{coord.row, coord.col + 1};
        case Direction::Up:    return Coordinate{coord.row - 1, coord.col};
        case Direction::Left:  return Coordinate{coord.row, coord.col - 1};
        case Direction::Down:  return Coordinate{coord.row + 1, coord.col};
    }
    return coord;
}

bool is_exit(const Grid& grid, const Coordinate& coord) {
    return coord.row == 0 || coord.row == grid.rows() - 1
        || coord.col == 0 || coord.col == grid.cols() - 1;
}

bool can_move(const Grid& grid, const Coordinate& coord, Direction dir) {
    Coordinate target = step(coord, dir);
    if (!grid.in_bounds(target.row, target.col)) return false;
    return grid.get(target.row, target.col) == Cell::Open;
}
