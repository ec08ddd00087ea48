#pragma once

#include "entity.hpp"
#include "grid.hpp"

#include <vector>

// Compositing of entity art onto a grid's live cells.
//
// place() and remove() are an exact inverse pair: the footprint returned by
// place() records what was under every written cell, and remove() writes it
// back. Calling place() twice for the same entity without a remove() in
// between records the entity's own glyphs as "prior" and corrupts the undo,
// so callers pair them strictly, one pair per move.

struct FootprintCell {
    Cell cell;
    char32_t prior = U' ';
    char32_t drawn = U' ';
};

struct Footprint {
    int entityId = 0;
    Cell anchor{ 0, 0 };
    std::vector<FootprintCell> cells; // in write order

    bool empty() const { return cells.empty(); }
    bool covers(const Cell& c) const;
};

// Art cells outside the grid are clipped; spaces in the art are skipped.
Footprint placeEntity(Grid& g, const Entity& e);
Footprint placeEntityAt(Grid& g, const Entity& e, const Cell& anchor);

// Restores the recorded cells in reverse write order.
void removeFootprint(Grid& g, const Footprint& fp);

// Stack helpers for several entities sharing a grid. Overlapping art is only
// undone correctly when footprints are removed in the reverse of the order
// they were placed, which removeAll() guarantees.
std::vector<Footprint> placeAll(Grid& g, const std::vector<const Entity*>& entities);
void removeAll(Grid& g, const std::vector<Footprint>& stack);
