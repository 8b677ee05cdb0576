// Google Test for the C entry point maze_run_instance
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

extern "C" int maze_run_instance(const char* input_file, long long max_nodes, double* out_time_ms,
                                 long long* out_path_count, int* out_shortest, int* out_longest,
                                 long long* out_visited);

static std::string write_temp_maze(const std::string& name, const std::string& text) {
    std::filesystem::path file = std::filesystem::temp_directory_path() / name;
    std::ofstream out(file);
    out << text;
    return file.string();
}

struct RunResult {
    int status = 0;
    double time_ms = -1.0;
    long long path_count = -1;
    int shortest = -1;
    int longest = -1;
    long long visited = -1;
};

static RunResult run(const std::string& file, long long max_nodes = 0) {
    RunResult r;
    r.status = maze_run_instance(file.c_str(), max_nodes, &r.time_ms, &r.path_count,
                                 &r.shortest, &r.longest, &r.visited);
    return r;
}

TEST(WalkerApi, SampleMaze) {
    std::string file = write_temp_maze("maze_walker_api_sample.txt",
        "xxxxxx\n0x000x\nx*0x0x\nxxxx00\n00000x\nxxxx0x\n");

    RunResult r = run(file);
    std::remove(file.c_str());

    EXPECT_EQ(r.status, 1);
    EXPECT_EQ(r.path_count, 3);
    EXPECT_EQ(r.shortest, 8);
    EXPECT_EQ(r.longest, 12);
    EXPECT_EQ(r.visited, 14);
    EXPECT_GE(r.time_ms, 0.0);
}

TEST(WalkerApi, StatusCodes) {
    std::string enclosed = write_temp_maze("maze_walker_api_enclosed.txt", "xxx\nx*x\nxxx\n");
    std::string malformed = write_temp_maze("maze_walker_api_malformed.txt", "xxx\nx*\nxxx\n");
    std::string sample = write_temp_maze("maze_walker_api_budget.txt",
        "xxxxxx\n0x000x\nx*0x0x\nxxxx00\n00000x\nxxxx0x\n");

    EXPECT_EQ(run(enclosed).status, 0);
    EXPECT_EQ(run(malformed).status, -3);
    EXPECT_EQ(run(sample, 5).status, -5);
    EXPECT_EQ(run("/nonexistent/dir/maze.txt").status, -2);

    std::remove(enclosed.c_str());
    std::remove(malformed.c_str());
    std::remove(sample.c_str());
}

TEST(WalkerApi, NullArgumentsRejected) {
    double ms;
    long long count, visited;
    int shortest, longest;

    EXPECT_EQ(maze_run_instance(nullptr, 0, &ms, &count, &shortest, &longest, &visited), -1);
    EXPECT_EQ(maze_run_instance("maze.txt", 0, nullptr, &count, &shortest, &longest, &visited), -1);
}
