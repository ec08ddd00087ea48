#include "grid.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

const char* gridErrorName(GridError e) {
    switch (e) {
        case GridError::None:               return "none";
        case GridError::OutOfBounds:        return "out of bounds";
        case GridError::InvalidGridShape:   return "invalid grid shape";
        case GridError::DanglingTransition: return "dangling transition";
    }
    return "unknown";
}

Grid::Grid(int width, int height, char32_t fill)
    : width_(std::max(0, width)), height_(std::max(0, height)) {
    cells_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), fill);
}

bool Grid::fromRows(const std::vector<std::string>& rows, Grid& out, GridError* err) {
    if (rows.empty()) {
        setGridError(err, GridError::InvalidGridShape);
        return false;
    }

    std::vector<std::u32string> decoded;
    decoded.reserve(rows.size());
    for (const std::string& r : rows) decoded.push_back(utf8::decode(r));

    const size_t w = decoded.front().size();
    if (w == 0) {
        setGridError(err, GridError::InvalidGridShape);
        return false;
    }
    for (const auto& r : decoded) {
        if (r.size() != w) {
            setGridError(err, GridError::InvalidGridShape);
            return false;
        }
    }

    Grid g(static_cast<int>(w), static_cast<int>(decoded.size()), U' ');
    for (int y = 0; y < g.height_; ++y) {
        const std::u32string& r = decoded[static_cast<size_t>(y)];
        std::copy(r.begin(), r.end(), g.cells_.begin() + static_cast<std::ptrdiff_t>(g.index(y, 0)));
    }

    out = std::move(g);
    setGridError(err, GridError::None);
    return true;
}

GridError Grid::get(int row, int col, char32_t& out) const {
    if (!inBounds(row, col)) return GridError::OutOfBounds;
    out = cells_[index(row, col)];
    return GridError::None;
}

GridError Grid::set(int row, int col, char32_t symbol) {
    if (!inBounds(row, col)) return GridError::OutOfBounds;
    cells_[index(row, col)] = symbol;
    return GridError::None;
}

void Grid::fill(char32_t symbol) {
    std::fill(cells_.begin(), cells_.end(), symbol);
}

void Grid::drawFrame(char32_t floor, const FrameStyle& style) {
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            char32_t& c = cells_[index(y, x)];
            if (y == 0 || y == height_ - 1) c = style.horizontal;
            else if (x == 0 || x == width_ - 1) c = style.vertical;
            else c = floor;
        }
    }
    if (width_ <= 0 || height_ <= 0) return;

    cells_[index(0, 0)] = style.topLeft;
    cells_[index(0, width_ - 1)] = style.topRight;
    cells_[index(height_ - 1, 0)] = style.bottomLeft;
    cells_[index(height_ - 1, width_ - 1)] = style.bottomRight;
}

int Grid::count(char32_t symbol) const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), symbol));
}

std::string Grid::row(int r) const {
    std::string out;
    if (r < 0 || r >= height_) return out;
    out.reserve(static_cast<size_t>(width_));
    for (int x = 0; x < width_; ++x) utf8::append(out, cells_[index(r, x)]);
    return out;
}

std::vector<std::string> Grid::rows() const {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(height_));
    for (int y = 0; y < height_; ++y) out.push_back(row(y));
    return out;
}
