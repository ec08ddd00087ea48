#include "transition.hpp"

#include <algorithm>

bool TransitionLink::targets(const Grid* g) const {
    const std::shared_ptr<Grid> d = destination();
    return d && d.get() == g;
}

void TransitionTable::add(const TransitionLink& link) {
    for (auto& l : links_) {
        if (l.portal() == link.portal()) {
            l = link;
            return;
        }
    }
    links_.push_back(link);
}

bool TransitionTable::removePortal(char32_t portal) {
    auto it = std::remove_if(links_.begin(), links_.end(),
                             [&](const TransitionLink& l) { return l.portal() == portal; });
    if (it == links_.end()) return false;
    links_.erase(it, links_.end());
    return true;
}

const TransitionLink* TransitionTable::find(char32_t symbol) const {
    for (const auto& l : links_) {
        if (l.portal() == symbol) return &l;
    }
    return nullptr;
}

std::optional<TransitionLink> checkTransition(const Grid& g, const Cell& pos, const TransitionTable& table) {
    char32_t sym = U' ';
    if (g.get(pos.row, pos.col, sym) != GridError::None) return std::nullopt;
    if (const TransitionLink* l = table.find(sym)) return *l;
    return std::nullopt;
}

std::optional<TransitionLink> checkTransition(const Grid& g, const Cell& pos, const TransitionTable& table,
                                              const OccupancyIndex& occ) {
    if (!g.inBounds(pos)) return std::nullopt;
    if (const TransitionLink* l = table.find(terrainAt(g, occ, pos))) return *l;
    return std::nullopt;
}

bool applyTransition(const TransitionLink& link, Entity& e, GridError* err) {
    const std::shared_ptr<Grid> dest = link.destination();
    if (!dest) {
        setGridError(err, GridError::DanglingTransition);
        return false;
    }
    if (!dest->inBounds(link.spawn())) {
        setGridError(err, GridError::OutOfBounds);
        return false;
    }

    e.where = Placement{ dest, link.spawn() };
    setGridError(err, GridError::None);
    return true;
}
