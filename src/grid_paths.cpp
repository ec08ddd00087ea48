#include "grid_paths.hpp"

#include <algorithm>
#include <deque>

namespace {

const Cell kDirs4[4] = { {1, 0}, {-1, 0}, {0, 1}, {0, -1} };

} // namespace

std::vector<int> bfsDistanceMap(const Grid& g, const Cell& start, const BlockerSet& blockers) {
    const size_t W = static_cast<size_t>(g.width());
    std::vector<int> dist(W * static_cast<size_t>(g.height()), -1);
    auto idx = [&](const Cell& c) { return static_cast<size_t>(c.row) * W + static_cast<size_t>(c.col); };

    if (!g.inBounds(start)) return dist;
    dist[idx(start)] = 0;

    std::deque<Cell> q;
    q.push_back(start);

    while (!q.empty()) {
        const Cell p = q.front();
        q.pop_front();
        const int cd = dist[idx(p)];

        for (const Cell& dv : kDirs4) {
            const Cell n = p + dv;
            if (!g.inBounds(n)) continue;
            if (blockers.blocks(g.at(n))) continue;
            if (dist[idx(n)] != -1) continue;
            dist[idx(n)] = cd + 1;
            q.push_back(n);
        }
    }

    return dist;
}

Cell farthestReachable(const Grid& g, const Cell& start, const BlockerSet& blockers) {
    const std::vector<int> dist = bfsDistanceMap(g, start, blockers);
    Cell best = start;
    int bestDist = 0;
    for (int r = 0; r < g.height(); ++r) {
        for (int c = 0; c < g.width(); ++c) {
            const int d = dist[static_cast<size_t>(r) * static_cast<size_t>(g.width()) + static_cast<size_t>(c)];
            if (d > bestDist) {
                bestDist = d;
                best = { r, c };
            }
        }
    }
    return best;
}

std::vector<Cell> shortestPath(const Grid& g, const Cell& start, const Cell& goal, const BlockerSet& blockers) {
    std::vector<Cell> path;
    if (!g.inBounds(goal)) return path;

    // Walk back from the goal along strictly decreasing distances.
    const std::vector<int> dist = bfsDistanceMap(g, start, blockers);
    const size_t W = static_cast<size_t>(g.width());
    auto at = [&](const Cell& c) { return dist[static_cast<size_t>(c.row) * W + static_cast<size_t>(c.col)]; };
    if (at(goal) < 0) return path;

    Cell cur = goal;
    path.push_back(cur);
    while (at(cur) > 0) {
        for (const Cell& dv : kDirs4) {
            const Cell n = cur + dv;
            if (!g.inBounds(n)) continue;
            if (at(n) == at(cur) - 1) {
                cur = n;
                break;
            }
        }
        path.push_back(cur);
    }

    std::reverse(path.begin(), path.end());
    return path;
}
