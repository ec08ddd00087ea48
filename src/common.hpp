#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

// Grid coordinate. Row-major, origin at the top-left corner.
struct Cell {
    int row = 0;
    int col = 0;
};

inline bool operator==(const Cell& a, const Cell& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Cell& a, const Cell& b) {
    return !(a == b);
}

inline Cell operator+(const Cell& a, const Cell& b) {
    return { a.row + b.row, a.col + b.col };
}

inline int manhattan(const Cell& a, const Cell& b) {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

// Inclusive movement envelope: minRow <= row <= maxRow, minCol <= col <= maxCol.
struct CellRect {
    int minRow = 0;
    int minCol = 0;
    int maxRow = 0;
    int maxCol = 0;

    bool contains(const Cell& c) const {
        return c.row >= minRow && c.row <= maxRow && c.col >= minCol && c.col <= maxCol;
    }
};

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline std::string cellToString(const Cell& c) {
    return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}
