#pragma once

#include "collision.hpp"
#include "entity.hpp"
#include "grid.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// A portal edge: stepping onto `portal` on the source grid relocates the
// entity to `spawn` on `destination`.
//
// The link holds only a weak reference. Many links may target the same grid
// and the host decides how long that grid lives; a link that outlives its
// destination reports DanglingTransition instead of relocating anything.
class TransitionLink {
public:
    TransitionLink(char32_t portal, const std::shared_ptr<Grid>& destination, Cell spawn,
                   std::string message = std::string())
        : portal_(portal), destination_(destination), spawn_(spawn), message_(std::move(message)) {}

    char32_t portal() const { return portal_; }
    Cell spawn() const { return spawn_; }
    const std::string& message() const { return message_; }

    std::shared_ptr<Grid> destination() const { return destination_.lock(); }
    bool dangling() const { return destination_.expired(); }
    bool targets(const Grid* g) const;

private:
    char32_t portal_;
    std::weak_ptr<Grid> destination_;
    Cell spawn_;
    std::string message_;
};

// Portal registrations for one source grid, keyed by symbol. Registering a
// symbol twice replaces the earlier link.
class TransitionTable {
public:
    void add(const TransitionLink& link);
    bool removePortal(char32_t portal);

    const TransitionLink* find(char32_t symbol) const;
    const std::vector<TransitionLink>& links() const { return links_; }
    bool empty() const { return links_.empty(); }

private:
    std::vector<TransitionLink> links_;
};

// None when the cell is out of bounds or its symbol is not a registered portal.
std::optional<TransitionLink> checkTransition(const Grid& g, const Cell& pos, const TransitionTable& table);
// Same, reading the terrain under any drawn entity art.
std::optional<TransitionLink> checkTransition(const Grid& g, const Cell& pos, const TransitionTable& table,
                                              const OccupancyIndex& occ);

// Swaps the entity's grid and position in one assignment. Fails with
// DanglingTransition when the destination is gone, OutOfBounds when the spawn
// cell lies outside it; in both cases the entity is left untouched.
bool applyTransition(const TransitionLink& link, Entity& e, GridError* err = nullptr);
