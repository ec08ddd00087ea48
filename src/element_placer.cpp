#include "element_placer.hpp"

bool Footprint::covers(const Cell& c) const {
    for (const FootprintCell& fc : cells) {
        if (fc.cell == c) return true;
    }
    return false;
}

Footprint placeEntity(Grid& g, const Entity& e) {
    return placeEntityAt(g, e, e.pos());
}

Footprint placeEntityAt(Grid& g, const Entity& e, const Cell& anchor) {
    Footprint fp;
    fp.entityId = e.id;
    fp.anchor = anchor;

    for (int y = 0; y < e.art.height(); ++y) {
        const std::u32string& line = e.art.lines[static_cast<size_t>(y)];
        for (int x = 0; x < static_cast<int>(line.size()); ++x) {
            const char32_t glyph = line[static_cast<size_t>(x)];
            if (glyph == U' ') continue;

            const int row = anchor.row + y;
            const int col = anchor.col + x;

            FootprintCell fc;
            fc.cell = { row, col };
            fc.drawn = glyph;
            if (g.get(row, col, fc.prior) != GridError::None) continue; // clipped

            (void)g.set(row, col, glyph);
            fp.cells.push_back(fc);
        }
    }
    return fp;
}

void removeFootprint(Grid& g, const Footprint& fp) {
    for (auto it = fp.cells.rbegin(); it != fp.cells.rend(); ++it) {
        (void)g.set(it->cell.row, it->cell.col, it->prior);
    }
}

std::vector<Footprint> placeAll(Grid& g, const std::vector<const Entity*>& entities) {
    std::vector<Footprint> stack;
    stack.reserve(entities.size());
    for (const Entity* e : entities) {
        if (!e) continue;
        stack.push_back(placeEntity(g, *e));
    }
    return stack;
}

void removeAll(Grid& g, const std::vector<Footprint>& stack) {
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        removeFootprint(g, *it);
    }
}
