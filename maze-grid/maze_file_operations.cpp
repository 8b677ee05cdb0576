#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_errors.hpp"
#include "maze_file_operations.hpp"

using namespace std;

static const char BLOCKED_SYMBOL = 'x';
static const char OPEN_SYMBOL = '0';
static const char START_SYMBOL = '*';

static string trim(const string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

static Cell cell_from_symbol(char symbol, size_t row, size_t col) {
    switch (symbol) {
        case BLOCKED_SYMBOL: return Cell::Blocked;
        case OPEN_SYMBOL:    return Cell::Open;
        case START_SYMBOL:   return Cell::Start;
        default:
            throw MalformedMaze("unrecognized character '" + string(1, symbol) + "' at row "
                                + to_string(row) + ", column " + to_string(col));
    }
}

static char symbol_from_cell(Cell cell) {
    switch (cell) {
        case Cell::Blocked: return BLOCKED_SYMBOL;
        case Cell::Start:   return START_SYMBOL;
        case Cell::Open:
        case Cell::Visited: return OPEN_SYMBOL;
    }
    return BLOCKED_SYMBOL;
}

Grid parse_maze(const string& text) {
    string body = trim(text);
    if (body.empty()) {
        throw MalformedMaze("no rows");
    }

    vector<vector<Cell>> rows;
    istringstream lines(body);
    string line;
    size_t start_markers = 0;
    while (getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!rows.empty() && line.size() != rows.front().size()) {
            throw MalformedMaze("row " + to_string(rows.size()) + " has length " + to_string(line.size())
                                + ", expected " + to_string(rows.front().size()));
        }
        vector<Cell> row;
        row.reserve(line.size());
        for (size_t col = 0; col < line.size(); ++col) {
            Cell cell = cell_from_symbol(line[col], rows.size(), col);
            if (cell == Cell::Start) start_markers++;
            row.push_back(cell);
        }
        rows.push_back(row);
    }

    if (start_markers != 1) {
        throw MalformedMaze("expected exactly one start marker, found " + to_string(start_markers));
    }
    return Grid(rows);
}

Grid read_maze_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    stringstream contents;
    contents << infile.rdbuf();
    return parse_maze(contents.str());
}

string maze_to_string(const Grid& grid) {
    string text;
    text.reserve(static_cast<size_t>(grid.rows()) * (grid.cols() + 1));
    for (int row = 0; row < grid.rows(); ++row) {
        for (int col = 0; col < grid.cols(); ++col) {
            text += symbol_from_cell(grid.get(row, col));
        }
        text += '\n';
    }
    return text;
}

void write_maze_to_file(const Grid& grid, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    outfile << maze_to_string(grid);
}
