#pragma once

#include "common.hpp"
#include "element_placer.hpp"
#include "entity.hpp"
#include "grid.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Impassable symbols for one grid. Supplied by the host; the core never
// derives it from the map contents.
class BlockerSet {
public:
    BlockerSet() = default;
    explicit BlockerSet(std::u32string symbols) : symbols_(std::move(symbols)) {}

    static BlockerSet fromText(const std::string& utf8Symbols);

    void add(char32_t s);
    bool blocks(char32_t s) const;
    bool empty() const { return symbols_.empty(); }
    const std::u32string& symbols() const { return symbols_; }

private:
    std::u32string symbols_;
};

struct Occupant {
    int entityId = 0;
    EntityKind kind = EntityKind::Npc;
    // Symbol the entity's art covered when it was drawn.
    char32_t base = U' ';
    bool hasBase = false;
};

// Per-cell occupant buckets for one grid, sized to that grid.
//
// Each placed entity contributes one occupant per drawn footprint cell,
// together with the symbol that was under it. Collision and portal checks
// read that recorded base symbol instead of the live cell, so an entity's own
// glyph (or a neighbor's) never masks the terrain beneath it.
class OccupancyIndex {
public:
    OccupancyIndex() = default;
    OccupancyIndex(int width, int height) { reset(width, height); }

    void reset(int width, int height);
    void clear();

    // Insert in placement order: the first occupant recorded on a cell holds
    // the true terrain symbol.
    void insert(const Entity& e, const Footprint& fp);
    void insertCell(int entityId, EntityKind kind, const Cell& c);
    void erase(int entityId);

    const std::vector<Occupant>& at(const Cell& c) const;
    std::optional<char32_t> baseSymbol(const Cell& c) const;
    bool occupied(const Cell& c, int ignoreEntityId = 0) const;

    int width() const { return width_; }
    int height() const { return height_; }

private:
    bool inBounds(const Cell& c) const {
        return c.row >= 0 && c.col >= 0 && c.row < height_ && c.col < width_;
    }
    size_t bucketIndex(const Cell& c) const { return static_cast<size_t>(c.row) * static_cast<size_t>(width_) + static_cast<size_t>(c.col); }

    int width_ = 0;
    int height_ = 0;
    std::vector<std::vector<Occupant>> buckets_;
};

enum class MoveResult : uint8_t {
    Moved = 0,
    Blocked,
};

const char* moveResultName(MoveResult r);

// Symbol used for passability and portal checks: the recorded base when an
// entity is drawn there, otherwise the live cell. Caller checks bounds.
char32_t terrainAt(const Grid& g, const OccupancyIndex& occ, const Cell& c);

// False when `pos` is outside the grid, when its terrain symbol is a blocker,
// or when an occupant other than `mover` is there and the two kinds may not
// share a cell. A null mover never shares.
bool canEnter(const Grid& g, const Cell& pos, const BlockerSet& blockers, const OccupancyIndex& occ,
              const Entity* mover = nullptr);

// Pure decision plus a single placement update on success. On Blocked the
// entity is untouched. A zero delta is Blocked.
//
// `err` receives OutOfBounds when the destination anchor leaves the grid and
// DanglingTransition when the entity's grid has been discarded.
MoveResult attemptMove(Entity& e, const Cell& delta, const BlockerSet& blockers, const OccupancyIndex& occ,
                       GridError* err = nullptr);
