#include "world.hpp"
#include "utf8.hpp"

#include <algorithm>

namespace {

constexpr size_t kMaxMessages = 200;

// Whether `e` could stand at `spawn` on the destination level: every
// in-bounds art cell must be enterable there.
bool spawnClear(const Level& dst, const Entity& e, const Cell& spawn) {
    std::vector<Cell> cells = e.footprintCells(spawn);
    if (cells.empty()) cells.push_back(spawn);
    for (const Cell& c : cells) {
        if (!dst.grid->inBounds(c)) continue;
        if (!canEnter(*dst.grid, c, dst.blockers, dst.occupancy, &e)) return false;
    }
    return true;
}

} // namespace

void SystemRegistry::registerSystem(const std::string& name, std::unique_ptr<WorldSystem> system) {
    for (auto& s : systems_) {
        if (s.first == name) {
            s.second = std::move(system);
            return;
        }
    }
    systems_.emplace_back(name, std::move(system));
}

bool SystemRegistry::unregisterSystem(const std::string& name) {
    for (auto it = systems_.begin(); it != systems_.end(); ++it) {
        if (it->first == name) {
            systems_.erase(it);
            return true;
        }
    }
    return false;
}

WorldSystem* SystemRegistry::get(const std::string& name) const {
    for (const auto& s : systems_) {
        if (s.first == name) return s.second.get();
    }
    return nullptr;
}

void SystemRegistry::updateAll(TurnContext& ctx) {
    for (auto& s : systems_) {
        if (s.second) s.second->onTurn(ctx);
    }
}

Level* World::addLevel(const std::string& name, std::shared_ptr<Grid> grid, BlockerSet blockers, std::string* err) {
    if (!grid) {
        if (err) *err = "level '" + name + "' has no grid";
        return nullptr;
    }
    if (level(name)) {
        if (err) *err = "level '" + name + "' already exists";
        return nullptr;
    }

    auto lv = std::make_unique<Level>();
    lv->name = name;
    lv->grid = std::move(grid);
    lv->blockers = std::move(blockers);
    lv->occupancy.reset(lv->grid->width(), lv->grid->height());
    levels_.push_back(std::move(lv));
    return levels_.back().get();
}

Level* World::level(const std::string& name) {
    for (auto& lv : levels_) {
        if (lv->name == name) return lv.get();
    }
    return nullptr;
}

const Level* World::level(const std::string& name) const {
    for (const auto& lv : levels_) {
        if (lv->name == name) return lv.get();
    }
    return nullptr;
}

Level* World::levelOf(const Grid* g) {
    if (!g) return nullptr;
    for (auto& lv : levels_) {
        if (lv->grid.get() == g) return lv.get();
    }
    return nullptr;
}

bool World::discardLevel(const std::string& name, std::string* err) {
    auto it = std::find_if(levels_.begin(), levels_.end(),
                           [&](const std::unique_ptr<Level>& lv) { return lv->name == name; });
    if (it == levels_.end()) {
        if (err) *err = "no level named '" + name + "'";
        return false;
    }
    if (!(*it)->stack.empty()) {
        if (err) *err = "level '" + name + "' still has entities on it";
        return false;
    }
    levels_.erase(it);
    return true;
}

bool World::linkPortal(const std::string& from, char32_t portal, const std::string& to, Cell spawn,
                       const std::string& message, std::string* err) {
    Level* src = level(from);
    Level* dst = level(to);
    if (!src || !dst) {
        if (err) *err = "unknown level in link " + from + " -> " + to;
        return false;
    }
    if (!dst->grid->inBounds(spawn)) {
        if (err) *err = "spawn " + cellToString(spawn) + " is outside level '" + to + "'";
        return false;
    }
    src->transitions.add(TransitionLink(portal, dst->grid, spawn, message));
    return true;
}

int World::spawn(EntityKind kind, const std::string& levelName, Cell pos, const Art* art, std::string* err) {
    Level* lv = level(levelName);
    if (!lv) {
        if (err) *err = "no level named '" + levelName + "'";
        return 0;
    }
    if (!lv->grid->inBounds(pos)) {
        if (err) *err = std::string(gridErrorName(GridError::OutOfBounds)) + ": " + cellToString(pos);
        return 0;
    }

    Entity e = makeEntity(nextEntityId_++, kind, lv->grid, pos);
    if (art && !art->empty()) e.art = *art;

    eraseDrawn(*lv);
    ents_.push_back(std::move(e));
    lv->stack.push_back(ents_.back().id);
    drawAll(*lv);
    return ents_.back().id;
}

int World::spawnPlayer(const std::string& levelName, Cell pos, const Art* art, std::string* err) {
    if (playerId_ != 0) {
        (void)removeEntity(playerId_);
        playerId_ = 0;
    }
    const int id = spawn(EntityKind::Player, levelName, pos, art, err);
    if (id != 0) playerId_ = id;
    return id;
}

bool World::removeEntity(int id) {
    auto it = std::find_if(ents_.begin(), ents_.end(), [&](const Entity& e) { return e.id == id; });
    if (it == ents_.end()) return false;

    for (auto& lv : levels_) {
        auto s = std::find(lv->stack.begin(), lv->stack.end(), id);
        if (s == lv->stack.end()) continue;
        eraseDrawn(*lv);
        lv->stack.erase(s);
        drawAll(*lv);
    }

    ents_.erase(it);
    if (playerId_ == id) playerId_ = 0;
    return true;
}

Entity* World::entity(int id) {
    if (id == 0) return nullptr;
    for (auto& e : ents_) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

const Entity* World::entity(int id) const {
    if (id == 0) return nullptr;
    for (const auto& e : ents_) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

std::string World::levelNameOf(const Entity& e) {
    const std::shared_ptr<Grid> g = e.grid();
    if (Level* lv = levelOf(g.get())) return lv->name;
    return std::string();
}

void World::eraseDrawn(Level& lv) {
    removeAll(*lv.grid, lv.drawn);
    lv.drawn.clear();
    lv.occupancy.clear();
}

void World::drawAll(Level& lv) {
    std::vector<const Entity*> order;
    order.reserve(lv.stack.size());
    for (int id : lv.stack) order.push_back(entity(id));

    lv.drawn = placeAll(*lv.grid, order);
    for (const Footprint& fp : lv.drawn) {
        if (const Entity* e = entity(fp.entityId)) lv.occupancy.insert(*e, fp);
    }
}

TurnReport World::step(int id, const Cell& delta) {
    TurnReport rep;
    rep.entityId = id;

    Entity* e = entity(id);
    if (!e) return rep;

    Level* from = levelOf(e->grid().get());
    if (!from) {
        rep.error = GridError::DanglingTransition;
        pushMsg("ENTITY " + std::to_string(id) + " IS ON A DISCARDED MAP.", MessageKind::System);
        return rep;
    }

    // 1-2. Collision check and position update (no mutation when blocked).
    const Placement before = e->where;
    rep.result = attemptMove(*e, delta, from->blockers, from->occupancy, &rep.error);
    if (rep.result == MoveResult::Blocked) {
        rep.level = from->name;
        rep.pos = e->pos();
        return rep;
    }

    // 3. Transition check. At most one transition per step, so a link back
    // onto a portal cell (including a self-link) never chains.
    Level* to = from;
    if (entityTraits(e->kind).usesPortals) {
        if (auto link = checkTransition(*from->grid, e->pos(), from->transitions, from->occupancy)) {
            // Only grids this world still hosts are valid destinations; a
            // discarded level counts as gone even if someone else keeps its
            // grid alive.
            const std::shared_ptr<Grid> destGrid = link->destination();
            Level* dst = levelOf(destGrid.get());
            GridError terr = GridError::None;
            if (!dst) {
                terr = GridError::DanglingTransition;
            } else if (dst->grid->inBounds(link->spawn()) && !spawnClear(*dst, *e, link->spawn())) {
                // The far side is taken: the whole move is refused.
                e->where = before;
                rep.result = MoveResult::Blocked;
                rep.level = from->name;
                rep.pos = e->pos();
                pushMsg("SOMETHING BLOCKS THE WAY THROUGH THE PORTAL " + utf8::encode(link->portal()) + ".",
                        MessageKind::Warning);
                return rep;
            } else if (applyTransition(*link, *e, &terr)) {
                rep.transitioned = true;
                to = dst;
                if (!link->message().empty()) pushMsg(link->message(), MessageKind::Info);
            }

            if (!rep.transitioned) {
                rep.error = terr;
                pushMsg("THE PORTAL " + utf8::encode(link->portal()) + " LEADS NOWHERE (" + gridErrorName(terr) + ").",
                        MessageKind::System);
            }
        }
    }

    // 4. Erase the old footprint, draw the new one.
    eraseDrawn(*from);
    if (to != from) {
        from->stack.erase(std::remove(from->stack.begin(), from->stack.end(), id), from->stack.end());
        drawAll(*from);
        eraseDrawn(*to);
        to->stack.push_back(id);
        drawAll(*to);
    } else {
        drawAll(*from);
    }

    rep.level = levelNameOf(*e);
    rep.pos = e->pos();
    return rep;
}

TurnReport World::playTurn(Action a, SystemRegistry& systems) {
    TurnReport rep;
    rep.entityId = playerId_;

    if (isMoveAction(a) && player()) {
        rep = step(playerId_, actionDelta(a));
    } else if (const Entity* p = player()) {
        rep.level = levelNameOf(*p);
        rep.pos = p->pos();
    }

    ++turn_;
    TurnContext ctx{ *this, rep, turn_ };
    systems.updateAll(ctx);
    return rep;
}

void World::pushMsg(const std::string& s, MessageKind kind) {
    if (!msgs_.empty() && msgs_.back().text == s && msgs_.back().kind == kind) {
        msgs_.back().repeat++;
        return;
    }
    Message m;
    m.text = s;
    m.kind = kind;
    msgs_.push_back(std::move(m));
    if (msgs_.size() > kMaxMessages) msgs_.erase(msgs_.begin());
}

std::vector<Message> World::drainMessages() {
    std::vector<Message> out;
    out.swap(msgs_);
    return out;
}
