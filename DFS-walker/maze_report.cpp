#include <ostream>
#include <sstream>
#include <string>

#include "maze_report.hpp"

using namespace std;

string format_path(const Path& path) {
    ostringstream ss;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) ss << ' ';
        ss << '(' << path[i].row << ' ' << path[i].col << ')';
    }
    return ss.str();
}

void format_report(const MazeReport& report, ostream& out) {
    out << "The maze has " << report.path_count << " paths." << '\n';
    out << "The shortest path in the maze is: " << report.shortest.size() << " steps long." << '\n';
    out << "The path is " << format_path(report.shortest) << '\n';
    out << "The longest path in the maze is: " << report.longest.size() << " steps long." << '\n';
    out << "The path is " << format_path(report.longest) << '\n';
}
