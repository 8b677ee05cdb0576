/**
 * @file grid.hpp
 * @brief Rectangular maze grid representation (cells, coordinates, snapshots).
 *
 * This header declares the Grid class used by the walker, the file helpers
 * and the sample generator.
 */

#ifndef __GRID_HPP___
#define __GRID_HPP___

#include <cstddef>
#include <vector>

/**
 * @brief State of a single maze cell.
 */
enum class Cell {
    Blocked,
    Open,
    Start,
    Visited
};

/**
 * @brief Zero-based (row, column) position in a grid.
 */
struct Coordinate {
    int row;
    int col;

    bool operator==(const Coordinate &rhs) const { return row == rhs.row && col == rhs.col; }
    bool operator!=(const Coordinate &rhs) const { return !(*this == rhs); }
};

/**
 * @brief Ordered sequence of coordinates from the start cell to an exit cell.
 */
using Path = std::vector<Coordinate>;

/**
 * @brief Immutable-per-step rectangular maze.
 *
 * Cells are stored row-major. A Grid is never changed by the walker: marking
 * a cell goes through set(), which returns a new snapshot and leaves the
 * original as it was.
 */
class Grid {

private:
    std::vector<Cell> cells;
    int row_count = 0;
    int col_count = 0;
    void init(const std::vector<Cell>& cells, int rows, int cols);
public:
    Grid() = default;

    /**
     * @brief Construct a grid from row-major cells.
     *
     * @param cells Cell values in row-major order (length = rows*cols).
     * @param rows Number of rows.
     * @param cols Number of columns.
     * @throws std::invalid_argument if the grid is empty or cells.size() != rows*cols.
     */
    Grid(const std::vector<Cell>& cells, int rows, int cols);

    /**
     * @brief Construct a grid from a list of rows.
     *
     * @param rows Rows of cells, all of equal length.
     * @throws std::invalid_argument if there are no rows, a row is empty, or rows differ in length.
     */
    explicit Grid(const std::vector<std::vector<Cell>>& rows);
    ~Grid() = default;

    // Rule of five
    Grid(const Grid& other) = default;
    Grid& operator=(const Grid& other) = default;
    Grid(Grid&& other) = default;
    Grid& operator=(Grid&& other) = default;

    int rows() const;
    int cols() const;

    /**
     * @brief Whether (row, col) addresses a cell of this grid.
     */
    bool in_bounds(int row, int col) const;

    /**
     * @brief Bounds-checked cell lookup.
     *
     * @throws std::out_of_range if (row, col) is outside the grid.
     */
    Cell get(int row, int col) const;

    /**
     * @brief Return a copy of this grid with a single cell replaced.
     *
     * The grid the method is called on is not modified.
     *
     * @param row Row of the cell to replace.
     * @param col Column of the cell to replace.
     * @param cell New cell value.
     * @throws std::out_of_range if (row, col) is outside the grid.
     * @return The updated snapshot.
     */
    Grid set(int row, int col, Cell cell) const;

    /**
     * @brief Number of cells holding the given value.
     */
    size_t count(Cell cell) const;

    bool operator==(const Grid &rhs) const;
};

/**
 * @brief Find the first start cell, scanning rows then columns.
 *
 * @param grid Grid to scan.
 * @throws NoStartFound if the grid holds no start cell.
 * @return Coordinate of the start cell.
 */
Coordinate locate_start(const Grid& grid);

#endif // __GRID_HPP___
