#pragma once

#include "collision.hpp"
#include "grid.hpp"

#include <vector>

// 4-way breadth-first helpers over a Grid, treating every symbol in
// `blockers` as solid. Used by the host to place portals and to walk scripted
// routes; entities are ignored.

// dist[row * width + col] is the step count from `start`, -1 when unreachable.
std::vector<int> bfsDistanceMap(const Grid& g, const Cell& start, const BlockerSet& blockers);

// Reachable cell with the largest distance; ties go to the first in row-major
// order. Returns `start` when nothing else is reachable.
Cell farthestReachable(const Grid& g, const Cell& start, const BlockerSet& blockers);

// Cells from start to goal inclusive; empty when the goal is unreachable.
std::vector<Cell> shortestPath(const Grid& g, const Cell& start, const Cell& goal, const BlockerSet& blockers);
