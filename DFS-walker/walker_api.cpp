#include <chrono>
#include <stdexcept>
#include <string>
#include "grid.hpp"
#include "maze_errors.hpp"
#include "maze_file_operations.hpp"
#include "maze-dfs-walker.hpp"

extern "C" {
    // Walk the maze in input_file; returns 1 if at least one path exists, 0 if
    // none does, negative on error (-1 bad arguments, -2 unreadable file,
    // -3 malformed maze, -4 no start, -5 node budget exceeded, -6 any other failure).
    // Outputs are only written on success.
    int maze_run_instance(
        const char* input_file,
        long long max_nodes,
        double* out_time_ms,
        long long* out_path_count,
        int* out_shortest,
        int* out_longest,
        long long* out_visited
    ) {
        if (!input_file || !out_time_ms || !out_path_count || !out_shortest || !out_longest || !out_visited) {
            return -1;
        }
        try {
            Grid maze = read_maze_from_file(std::string(input_file));
            SearchOptions options;
            options.max_nodes = max_nodes;

            auto t0 = std::chrono::steady_clock::now();
            long long visited_nodes = 0;
            MazeReport report = walk_maze(maze, options, &visited_nodes);
            auto t1 = std::chrono::steady_clock::now();
            double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

            *out_time_ms = ms;
            *out_path_count = static_cast<long long>(report.path_count);
            *out_shortest = static_cast<int>(report.shortest.size());
            *out_longest = static_cast<int>(report.longest.size());
            *out_visited = visited_nodes;
            return 1;
        } catch (const EmptyPathSet&) {
            return 0;
        } catch (const MalformedMaze&) {
            return -3;
        } catch (const NoStartFound&) {
            return -4;
        } catch (const SearchAborted&) {
            return -5;
        } catch (const std::runtime_error&) {
            return -2;
        } catch (const std::exception&) {
            return -6;
        }
    }
}
