// Google Test for maze text parsing and file helpers
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "maze_errors.hpp"
#include "maze_file_operations.hpp"

static const std::string SAMPLE_MAZE =
    "xxxxxx\n"
    "0x000x\n"
    "x*0x0x\n"
    "xxxx00\n"
    "00000x\n"
    "xxxx0x\n";

TEST(ParseMaze, SampleMaze) {
    Grid g = parse_maze(SAMPLE_MAZE);

    EXPECT_EQ(g.rows(), 6);
    EXPECT_EQ(g.cols(), 6);
    EXPECT_EQ(g.get(0, 0), Cell::Blocked);
    EXPECT_EQ(g.get(1, 0), Cell::Open);
    EXPECT_EQ(g.get(2, 1), Cell::Start);
    EXPECT_EQ(g.get(3, 5), Cell::Open);
    EXPECT_EQ(g.count(Cell::Start), 1u);

    Coordinate start = locate_start(g);
    EXPECT_EQ(start.row, 2);
    EXPECT_EQ(start.col, 1);
}

TEST(ParseMaze, SurroundingWhitespaceIsTrimmed) {
    Grid g = parse_maze("\n\n  \n" + SAMPLE_MAZE + "\n\n   \t\n");

    EXPECT_TRUE(g == parse_maze(SAMPLE_MAZE));
}

TEST(ParseMaze, CarriageReturnsAreDropped) {
    Grid g = parse_maze("xxx\r\nx*x\r\nx0x\r\n");

    EXPECT_EQ(g.rows(), 3);
    EXPECT_EQ(g.cols(), 3);
    EXPECT_EQ(g.get(2, 1), Cell::Open);
}

TEST(ParseMaze, SingleRow) {
    Grid g = parse_maze("*00");

    EXPECT_EQ(g.rows(), 1);
    EXPECT_EQ(g.cols(), 3);
    EXPECT_EQ(g.get(0, 0), Cell::Start);
}

TEST(ParseMaze, UnequalRowsThrows) {
    EXPECT_THROW(parse_maze("xxx\nx*\nxxx"), MalformedMaze);
    EXPECT_THROW(parse_maze("xxx\n\nx*x"), MalformedMaze);
}

TEST(ParseMaze, UnknownCharacterThrows) {
    EXPECT_THROW(parse_maze("xxx\nx*#\nxxx"), MalformedMaze);
    EXPECT_THROW(parse_maze("xxx\nx* \nxxx"), MalformedMaze);
}

TEST(ParseMaze, StartMarkerCountThrows) {
    EXPECT_THROW(parse_maze("xxx\nx0x\nxxx"), MalformedMaze);
    EXPECT_THROW(parse_maze("xxx\n**x\nxxx"), MalformedMaze);
}

TEST(ParseMaze, EmptyTextThrows) {
    EXPECT_THROW(parse_maze(""), MalformedMaze);
    EXPECT_THROW(parse_maze(" \n\t\n"), MalformedMaze);
}

TEST(ParseMaze, MalformedMazeIsInvalidArgument) {
    EXPECT_THROW(parse_maze("abc"), std::invalid_argument);
}

TEST(MazeToString, VisitedWrittenAsOpen) {
    Grid g = parse_maze("xxx\nx*0\nxxx").set(1, 2, Cell::Visited);

    EXPECT_EQ(maze_to_string(g), "xxx\nx*0\nxxx\n");
}

TEST(MazeFile, WriteThenRead) {
    std::filesystem::path file = std::filesystem::temp_directory_path() / "maze_walker_test_write_read.txt";
    Grid g = parse_maze(SAMPLE_MAZE);

    write_maze_to_file(g, file.string());
    Grid back = read_maze_from_file(file.string());
    std::remove(file.string().c_str());

    EXPECT_TRUE(back == g);
}

TEST(MazeFile, MissingFileThrows) {
    EXPECT_THROW(read_maze_from_file("/nonexistent/dir/maze.txt"), std::runtime_error);
}
