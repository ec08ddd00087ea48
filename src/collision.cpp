#include "collision.hpp"
#include "utf8.hpp"

#include <algorithm>

BlockerSet BlockerSet::fromText(const std::string& utf8Symbols) {
    BlockerSet b;
    for (char32_t s : utf8::decode(utf8Symbols)) {
        if (s == U' ' || s == U',') continue;
        b.add(s);
    }
    return b;
}

void BlockerSet::add(char32_t s) {
    if (!blocks(s)) symbols_.push_back(s);
}

bool BlockerSet::blocks(char32_t s) const {
    return symbols_.find(s) != std::u32string::npos;
}

void OccupancyIndex::reset(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    buckets_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), {});
}

void OccupancyIndex::clear() {
    for (auto& b : buckets_) b.clear();
}

void OccupancyIndex::insert(const Entity& e, const Footprint& fp) {
    for (const FootprintCell& fc : fp.cells) {
        if (!inBounds(fc.cell)) continue;
        Occupant o;
        o.entityId = e.id;
        o.kind = e.kind;
        o.base = fc.prior;
        o.hasBase = true;
        buckets_[bucketIndex(fc.cell)].push_back(o);
    }
}

void OccupancyIndex::insertCell(int entityId, EntityKind kind, const Cell& c) {
    if (!inBounds(c)) return;
    Occupant o;
    o.entityId = entityId;
    o.kind = kind;
    buckets_[bucketIndex(c)].push_back(o);
}

void OccupancyIndex::erase(int entityId) {
    for (auto& b : buckets_) {
        b.erase(std::remove_if(b.begin(), b.end(), [&](const Occupant& o) { return o.entityId == entityId; }),
                b.end());
    }
}

const std::vector<Occupant>& OccupancyIndex::at(const Cell& c) const {
    static const std::vector<Occupant> kNone;
    if (!inBounds(c)) return kNone;
    return buckets_[bucketIndex(c)];
}

std::optional<char32_t> OccupancyIndex::baseSymbol(const Cell& c) const {
    for (const Occupant& o : at(c)) {
        if (o.hasBase) return o.base;
    }
    return std::nullopt;
}

bool OccupancyIndex::occupied(const Cell& c, int ignoreEntityId) const {
    for (const Occupant& o : at(c)) {
        if (o.entityId != ignoreEntityId) return true;
    }
    return false;
}

const char* moveResultName(MoveResult r) {
    switch (r) {
        case MoveResult::Moved:   return "moved";
        case MoveResult::Blocked: return "blocked";
    }
    return "unknown";
}

char32_t terrainAt(const Grid& g, const OccupancyIndex& occ, const Cell& c) {
    if (const auto base = occ.baseSymbol(c)) return *base;
    return g.at(c);
}

bool canEnter(const Grid& g, const Cell& pos, const BlockerSet& blockers, const OccupancyIndex& occ,
              const Entity* mover) {
    if (!g.inBounds(pos)) return false;
    if (blockers.blocks(terrainAt(g, occ, pos))) return false;

    for (const Occupant& o : occ.at(pos)) {
        if (mover && o.entityId == mover->id) continue;
        if (mover && entityTraits(mover->kind).coOccupy && entityTraits(o.kind).coOccupy) continue;
        return false;
    }
    return true;
}

MoveResult attemptMove(Entity& e, const Cell& delta, const BlockerSet& blockers, const OccupancyIndex& occ,
                       GridError* err) {
    setGridError(err, GridError::None);
    if (delta.row == 0 && delta.col == 0) return MoveResult::Blocked;

    const std::shared_ptr<Grid> g = e.grid();
    if (!g) {
        setGridError(err, GridError::DanglingTransition);
        return MoveResult::Blocked;
    }

    const Cell dest = e.pos() + delta;

    // The envelope wins over grid content.
    if (e.bounds && !e.bounds->contains(dest)) return MoveResult::Blocked;

    if (!g->inBounds(dest)) {
        setGridError(err, GridError::OutOfBounds);
        return MoveResult::Blocked;
    }

    std::vector<Cell> cells = e.footprintCells(dest);
    if (cells.empty()) cells.push_back(dest);

    for (const Cell& c : cells) {
        if (!g->inBounds(c)) continue; // clipped art
        if (!canEnter(*g, c, blockers, occ, &e)) return MoveResult::Blocked;
    }

    e.where = Placement{ e.where.grid, dest };
    return MoveResult::Moved;
}
