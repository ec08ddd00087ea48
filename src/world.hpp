#pragma once

#include "action.hpp"
#include "collision.hpp"
#include "element_placer.hpp"
#include "entity.hpp"
#include "grid.hpp"
#include "transition.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Warning,
    System,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicates are compacted: "THE WALL BLOCKS YOUR WAY." three
    // times becomes one entry with repeat=3.
    int repeat = 1;
};

// One map the world can host entities on.
struct Level {
    std::string name;
    std::shared_ptr<Grid> grid;
    BlockerSet blockers;
    TransitionTable transitions;

    // Drawing state. `stack` lists entity ids in draw order; `drawn` holds the
    // matching footprints while they are composited onto `grid`.
    std::vector<int> stack;
    std::vector<Footprint> drawn;
    OccupancyIndex occupancy;
};

struct TurnReport {
    int entityId = 0;
    MoveResult result = MoveResult::Blocked;
    bool transitioned = false;
    GridError error = GridError::None;
    std::string level; // level the entity ends the turn on
    Cell pos{ -1, -1 };
};

class World;

struct TurnContext {
    World& world;
    const TurnReport& report;
    uint32_t turn;
};

// An auxiliary subsystem updated once per turn (quests, farms, timers, ...).
class WorldSystem {
public:
    virtual ~WorldSystem() = default;
    virtual void onTurn(TurnContext& ctx) = 0;
};

// Named systems, updated in registration order. The host loop creates the
// registry at startup, passes it into every World::playTurn call, and
// destroys it at shutdown; nothing in the core reaches it through globals.
class SystemRegistry {
public:
    // Replaces an existing system with the same name.
    void registerSystem(const std::string& name, std::unique_ptr<WorldSystem> system);
    bool unregisterSystem(const std::string& name);

    WorldSystem* get(const std::string& name) const;
    size_t size() const { return systems_.size(); }

    void updateAll(TurnContext& ctx);

private:
    std::vector<std::pair<std::string, std::unique_ptr<WorldSystem>>> systems_;
};

// Owns levels and entities and runs turns in the fixed order:
// collision check, position update, transition check, footprint redraw.
//
// Level pointers stay valid until that level is discarded. Entity pointers
// are invalidated by spawn/remove, so hold ids across calls.
class World {
public:
    Level* addLevel(const std::string& name, std::shared_ptr<Grid> grid, BlockerSet blockers,
                    std::string* err = nullptr);
    Level* level(const std::string& name);
    const Level* level(const std::string& name) const;
    Level* levelOf(const Grid* g);
    const std::vector<std::unique_ptr<Level>>& levels() const { return levels_; }

    // Refused while any entity stands on the level. Links into it from other
    // levels are kept and report DanglingTransition when used, even if the
    // host still holds the grid.
    bool discardLevel(const std::string& name, std::string* err = nullptr);

    bool linkPortal(const std::string& from, char32_t portal, const std::string& to, Cell spawn,
                    const std::string& message = std::string(), std::string* err = nullptr);

    // Returns the new entity id, or 0 on failure. The spawn cell must be
    // inside the grid; passability is the caller's call.
    int spawn(EntityKind kind, const std::string& levelName, Cell pos, const Art* art = nullptr,
              std::string* err = nullptr);
    // Single player slot: replaces any previous player.
    int spawnPlayer(const std::string& levelName, Cell pos, const Art* art = nullptr, std::string* err = nullptr);
    bool removeEntity(int id);

    Entity* entity(int id);
    const Entity* entity(int id) const;
    Entity* player() { return entity(playerId_); }
    int playerId() const { return playerId_; }
    const std::vector<Entity>& entities() const { return ents_; }

    // Moves one entity by `delta` as a single turn step. A portal whose spawn
    // is blocked or occupied refuses the whole move; one into a level this
    // world no longer hosts reports DanglingTransition and leaves the entity
    // on the portal cell.
    TurnReport step(int id, const Cell& delta);

    // Interprets a tagged command for the player, then updates `systems`.
    TurnReport playTurn(Action a, SystemRegistry& systems);

    uint32_t turn() const { return turn_; }

    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);
    const std::vector<Message>& messages() const { return msgs_; }
    std::vector<Message> drainMessages();

private:
    void eraseDrawn(Level& lv);
    void drawAll(Level& lv);
    std::string levelNameOf(const Entity& e);

    std::vector<std::unique_ptr<Level>> levels_;
    std::vector<Entity> ents_;
    std::vector<Message> msgs_;
    int nextEntityId_ = 1;
    int playerId_ = 0;
    uint32_t turn_ = 0;
};
