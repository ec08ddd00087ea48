#pragma once

#include "grid.hpp"
#include "rng.hpp"

#include <optional>

// Perfect-maze carving (randomized depth-first backtracker).
//
// Carving happens on the odd lattice: cells whose row and column are both odd.
// A wall cell always stays between two carved lattice cells until the walk
// connects them, and the outer ring is never touched, so the border survives.
//
// Seeded contract: at every step the four directions {N, S, W, E} are
// shuffled with RNG::shuffle and the first unvisited neighbor wins. A fixed
// seed produces byte-identical grids.

struct MazeParams {
    char32_t wall = U'#';
    char32_t floor = U'.';

    // Start cell. Clamped into the interior and snapped to the odd lattice.
    // When unset a random lattice cell is drawn from the RNG.
    std::optional<Cell> start;

    // Reset every cell to `wall` before carving.
    bool clearToWall = false;
};

struct MazeResult {
    bool carved = false;   // false for grids with no interior (smaller than 3x3)
    Cell start{ -1, -1 };  // start after clamping
    int floorCells = 0;    // lattice cells + connectors carved
    int deadEnds = 0;      // lattice cells the walk had to backtrack out of
};

// Snaps `c` into [1, size-2] on both axes and onto odd coordinates.
// Returns false when the grid has no interior.
bool clampMazeStart(const Grid& g, Cell& c);

MazeResult generateMaze(Grid& g, RNG& rng, const MazeParams& params = MazeParams{});
