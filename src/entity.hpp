#pragma once
#include "common.hpp"
#include "grid.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class EntityKind : uint8_t {
    Player = 0,
    Npc,
    // Draggable editor element with multi-cell art.
    Element,
};

// Per-kind behavior the movement core consults. Kind-specific game rules
// (stats, dialogue, shops) live with the host, keyed by EntityKind.
struct EntityTraits {
    EntityKind kind;
    const char* name;
    char32_t defaultGlyph;
    // May share a cell with another entity whose kind also allows it.
    bool coOccupy;
    // Follows TransitionLinks when stepping onto a portal symbol.
    bool usesPortals;
};

const EntityTraits& entityTraits(EntityKind k);

// Multi-line glyph. Rows may have different lengths; a space is transparent.
struct Art {
    std::vector<std::u32string> lines;

    int height() const { return static_cast<int>(lines.size()); }
    int width() const;
    bool empty() const { return lines.empty(); }

    static Art single(char32_t glyph);

    // Splits UTF-8 text on '\n'. One leading and one trailing empty line are
    // dropped so raw string literals can start and end on their own lines.
    static Art fromText(const std::string& text);
};

// Where an entity currently is. Grid and position always change together:
// the whole struct is replaced in one assignment, never field by field.
struct Placement {
    std::weak_ptr<Grid> grid;
    Cell pos{ 0, 0 };
};

struct Entity {
    int id = 0;
    EntityKind kind = EntityKind::Npc;
    std::string name;

    Placement where;
    Art art;

    std::optional<CellRect> bounds;

    const Cell& pos() const { return where.pos; }

    // Null when the referenced grid has been discarded by the host.
    std::shared_ptr<Grid> grid() const { return where.grid.lock(); }

    bool isOn(const Grid* g) const;

    // Cells covered by non-transparent art when anchored at `anchor`. Not clipped.
    std::vector<Cell> footprintCells(const Cell& anchor) const;
};

Entity makeEntity(int id, EntityKind kind, const std::shared_ptr<Grid>& grid, Cell pos);
