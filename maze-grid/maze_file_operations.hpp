#ifndef __MAZE_FILE_OPERATIONS_HPP___
#define __MAZE_FILE_OPERATIONS_HPP___

#include <string>

#include "grid.hpp"

/**
 * @file maze_file_operations.hpp
 * @brief Helpers to read/write `Grid` values from plain text.
 *
 * The format is one row per line, one character per cell:
 * `x` blocked, `0` open, `*` start (exactly once). Example:
 *
 *     xxxxxx
 *     0x000x
 *     x*0x0x
 *     xxxx00
 *     00000x
 *     xxxx0x
 */

/**
 * @brief Parse maze text into a `Grid`.
 *
 * Leading and trailing whitespace around the whole text is ignored, and a
 * trailing carriage return on a line is dropped.
 *
 * @param text Maze description.
 * @throws MalformedMaze on unequal row lengths, unknown symbols, a start
 *         marker count other than one, or empty text.
 * @return Parsed grid in its initial state.
 */
Grid parse_maze(const std::string& text);

/**
 * @brief Read a `Grid` from a plain-text maze file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws MalformedMaze if the contents do not parse.
 */
Grid read_maze_from_file(const std::string& filename);

/**
 * @brief Render a `Grid` in the text format (visited cells are written as open).
 */
std::string maze_to_string(const Grid& grid);

/**
 * @brief Write a `Grid` to a plain-text maze file.
 *
 * @param grid Grid to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_maze_to_file(const Grid& grid, const std::string& filename);

#endif // __MAZE_FILE_OPERATIONS_HPP___
