#include "maze.hpp"

#include <vector>

namespace {

int clampOdd(int v, int size) {
    // Largest interior odd index is size-2 when size is odd, size-3 when even.
    const int hi = (size % 2 == 1) ? size - 2 : size - 3;
    v = clampi(v, 1, hi);
    if (v % 2 == 0) v -= 1;
    return v;
}

bool isLatticeInterior(const Grid& g, const Cell& c) {
    return c.row >= 1 && c.col >= 1 && c.row <= g.height() - 2 && c.col <= g.width() - 2;
}

} // namespace

bool clampMazeStart(const Grid& g, Cell& c) {
    if (g.width() < 3 || g.height() < 3) return false;
    c.row = clampOdd(c.row, g.height());
    c.col = clampOdd(c.col, g.width());
    return true;
}

MazeResult generateMaze(Grid& g, RNG& rng, const MazeParams& params) {
    MazeResult out;

    if (params.clearToWall) g.fill(params.wall);

    Cell start{ 1, 1 };
    if (params.start) {
        start = *params.start;
    } else if (g.width() >= 3 && g.height() >= 3) {
        const int cellW = (g.width() - 1) / 2;
        const int cellH = (g.height() - 1) / 2;
        start = { 1 + 2 * rng.range(0, cellH - 1), 1 + 2 * rng.range(0, cellW - 1) };
    }
    if (!clampMazeStart(g, start)) return out;

    const size_t W = static_cast<size_t>(g.width());
    auto idx = [&](const Cell& c) { return static_cast<size_t>(c.row) * W + static_cast<size_t>(c.col); };

    std::vector<uint8_t> visited(W * static_cast<size_t>(g.height()), 0);
    std::vector<Cell> stack;
    stack.reserve(static_cast<size_t>(g.width() / 2) * static_cast<size_t>(g.height() / 2));

    visited[idx(start)] = 1;
    (void)g.set(start.row, start.col, params.floor);
    stack.push_back(start);
    out.carved = true;
    out.start = start;
    out.floorCells = 1;

    bool advanced = true;
    while (!stack.empty()) {
        const Cell cur = stack.back();

        Cell dirs[4] = { {-2, 0}, {2, 0}, {0, -2}, {0, 2} };
        rng.shuffle(dirs);

        bool found = false;
        for (const Cell& d : dirs) {
            const Cell nxt = cur + d;
            if (!isLatticeInterior(g, nxt)) continue;
            if (visited[idx(nxt)] != 0) continue;

            const Cell mid{ cur.row + d.row / 2, cur.col + d.col / 2 };
            (void)g.set(mid.row, mid.col, params.floor);
            (void)g.set(nxt.row, nxt.col, params.floor);
            visited[idx(nxt)] = 1;
            stack.push_back(nxt);
            out.floorCells += 2;
            found = true;
            break;
        }

        if (!found) {
            if (advanced) out.deadEnds++;
            stack.pop_back();
        }
        advanced = found;
    }

    return out;
}
