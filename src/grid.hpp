#pragma once
#include "common.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Typed failure kinds shared by every core operation.
//
// OutOfBounds and InvalidGridShape are local: the caller clamps or treats the
// request as a blocked move. DanglingTransition means a link (or an entity)
// still points at a grid the host has discarded; it is reported, never retried.
enum class GridError : uint8_t {
    None = 0,
    OutOfBounds,
    InvalidGridShape,
    DanglingTransition,
};

const char* gridErrorName(GridError e);

inline void setGridError(GridError* err, GridError e) {
    if (err) *err = e;
}

// Box-drawing characters used by Grid::drawFrame.
struct FrameStyle {
    char32_t horizontal = U'═';
    char32_t vertical = U'║';
    char32_t topLeft = U'╔';
    char32_t topRight = U'╗';
    char32_t bottomLeft = U'╚';
    char32_t bottomRight = U'╝';
};

// A rectangular map of display symbols, one code point per cell.
//
// The dimensions are fixed at construction; swapping maps means building a
// new Grid. get()/set() are the checked accessors; at() is unchecked and is
// meant for loops that already validated their coordinates.
class Grid {
public:
    Grid() = default;
    Grid(int width, int height, char32_t fill);

    // Builds a grid from UTF-8 text rows. Every row must decode to the same,
    // non-zero number of code points.
    static bool fromRows(const std::vector<std::string>& rows, Grid& out, GridError* err = nullptr);

    int width() const { return width_; }
    int height() const { return height_; }

    struct Dimensions {
        int width = 0;
        int height = 0;
    };
    Dimensions dimensions() const { return { width_, height_ }; }

    bool inBounds(int row, int col) const {
        return row >= 0 && col >= 0 && row < height_ && col < width_;
    }
    bool inBounds(const Cell& c) const { return inBounds(c.row, c.col); }

    GridError get(int row, int col, char32_t& out) const;
    GridError set(int row, int col, char32_t symbol);

    char32_t at(int row, int col) const { return cells_[index(row, col)]; }
    char32_t at(const Cell& c) const { return at(c.row, c.col); }

    void fill(char32_t symbol);

    // Replaces the outer ring with a box border and the interior with `floor`.
    void drawFrame(char32_t floor, const FrameStyle& style = FrameStyle{});

    int count(char32_t symbol) const;

    // Row sequence for rendering (UTF-8).
    std::vector<std::string> rows() const;
    std::string row(int r) const;

    bool operator==(const Grid& o) const {
        return width_ == o.width_ && height_ == o.height_ && cells_ == o.cells_;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    size_t index(int row, int col) const { return static_cast<size_t>(row) * static_cast<size_t>(width_) + static_cast<size_t>(col); }

    int width_ = 0;
    int height_ = 0;
    std::vector<char32_t> cells_;
};
