#include "action.hpp"
#include "collision.hpp"
#include "editor.hpp"
#include "element_placer.hpp"
#include "entity.hpp"
#include "grid.hpp"
#include "grid_paths.hpp"
#include "maze.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "transition.hpp"
#include "utf8.hpp"
#include "world.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <queue>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

std::shared_ptr<Grid> makeGrid(const std::vector<std::string>& rows) {
    auto g = std::make_shared<Grid>();
    GridError err = GridError::None;
    const bool ok = Grid::fromRows(rows, *g, &err);
    expect(ok, std::string("fixture grid rejected: ") + gridErrorName(err));
    return g;
}

// Floor-cell connectivity and edge count for the perfect-maze property.
struct FloorStats {
    int nodes = 0;
    int edges = 0;
    int reachable = 0;
};

FloorStats floorStats(const Grid& g, char32_t floor, Cell start) {
    FloorStats s;
    for (int r = 0; r < g.height(); ++r) {
        for (int c = 0; c < g.width(); ++c) {
            if (g.at(r, c) != floor) continue;
            s.nodes++;
            if (c + 1 < g.width() && g.at(r, c + 1) == floor) s.edges++;
            if (r + 1 < g.height() && g.at(r + 1, c) == floor) s.edges++;
        }
    }

    std::vector<uint8_t> seen(static_cast<size_t>(g.width() * g.height()), 0);
    auto idx = [&](Cell c) { return static_cast<size_t>(c.row * g.width() + c.col); };
    if (!g.inBounds(start) || g.at(start) != floor) return s;

    std::queue<Cell> q;
    q.push(start);
    seen[idx(start)] = 1;
    const Cell dirs[4] = { {1, 0}, {-1, 0}, {0, 1}, {0, -1} };
    while (!q.empty()) {
        const Cell p = q.front();
        q.pop();
        s.reachable++;
        for (const Cell& d : dirs) {
            const Cell n = p + d;
            if (!g.inBounds(n) || g.at(n) != floor || seen[idx(n)]) continue;
            seen[idx(n)] = 1;
            q.push(n);
        }
    }
    return s;
}

bool borderIsWall(const Grid& g, char32_t wall) {
    for (int c = 0; c < g.width(); ++c) {
        if (g.at(0, c) != wall || g.at(g.height() - 1, c) != wall) return false;
    }
    for (int r = 0; r < g.height(); ++r) {
        if (g.at(r, 0) != wall || g.at(r, g.width() - 1) != wall) return false;
    }
    return true;
}

// Records what every turn looked like to an observer outside the core.
class PlacementObserver : public WorldSystem {
public:
    explicit PlacementObserver(const Grid* portalGrid) : portalGrid_(portalGrid) {}

    void onTurn(TurnContext& ctx) override {
        turns++;
        const Entity* p = ctx.world.player();
        if (!p) return;
        const std::shared_ptr<Grid> g = p->grid();
        if (g.get() == portalGrid_ && p->pos() == Cell{ 1, 1 }) sawMixedState = true;
        lastTurn = ctx.turn;
    }

    int turns = 0;
    uint32_t lastTurn = 0;
    bool sawMixedState = false;

private:
    const Grid* portalGrid_;
};

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    int items[4] = { 0, 1, 2, 3 };
    for (int round = 0; round < 50; ++round) {
        rng.shuffle(items);
        int mask = 0;
        for (int v : items) mask |= 1 << v;
        expect(mask == 0xF, "shuffle must keep a permutation");
    }
}

void test_grid_bounds() {
    Grid g(4, 3, U'#');
    expect(g.dimensions().width == 4 && g.dimensions().height == 3, "Grid dimensions");

    char32_t out = 0;
    expect(g.get(2, 3, out) == GridError::None && out == U'#', "get inside bounds");
    expect(g.get(3, 0, out) == GridError::OutOfBounds, "get row == height is out of bounds");
    expect(g.get(0, -1, out) == GridError::OutOfBounds, "get negative col is out of bounds");

    expect(g.set(1, 1, U'.') == GridError::None, "set inside bounds");
    expect(g.at(1, 1) == U'.', "set writes the cell");
    expect(g.set(1, 4, U'.') == GridError::OutOfBounds, "set col == width is out of bounds");
    expect(g.count(U'.') == 1, "out-of-bounds set must not write anything");

    Grid wide(70000, 2, U'.');
    expect(wide.set(1, 69999, U'#') == GridError::None && wide.at(1, 69999) == U'#', "last cell of a wide grid");
    expect(wide.count(U'#') == 1, "wide grid indexing stays in its row");
    OccupancyIndex occ(70000, 2);
    occ.insertCell(1, EntityKind::Npc, { 1, 69999 });
    expect(occ.occupied({ 1, 69999 }) && !occ.occupied({ 0, 69999 }), "occupancy buckets on a wide grid");
}

void test_grid_from_rows_shape() {
    Grid g;
    GridError err = GridError::None;

    expect(!Grid::fromRows({ "###", "#.", "###" }, g, &err), "ragged rows must be rejected");
    expect(err == GridError::InvalidGridShape, "ragged rows report InvalidGridShape");
    expect(!Grid::fromRows({}, g, &err) && err == GridError::InvalidGridShape, "no rows is an invalid shape");
    expect(!Grid::fromRows({ "", "" }, g, &err) && err == GridError::InvalidGridShape, "zero-width rows are invalid");

    // Box-drawing characters are one cell each despite being multi-byte.
    expect(Grid::fromRows({ "╔═╗", "║.║", "╚═╝" }, g, &err), "UTF-8 rows accepted");
    expect(g.width() == 3 && g.height() == 3, "UTF-8 rows measured in code points");
    expect(g.at(0, 1) == U'═' && g.at(1, 1) == U'.', "UTF-8 symbols decoded");
    expect(g.row(0) == "╔═╗", "rows() re-encodes UTF-8");
}

void test_grid_frame() {
    Grid g(5, 4, U'?');
    g.drawFrame(U'.');
    expect(g.row(0) == "╔═══╗", "frame top row");
    expect(g.row(1) == "║...║", "frame interior row");
    expect(g.row(3) == "╚═══╝", "frame bottom row");
}

void test_maze_deterministic() {
    MazeParams p;
    p.start = Cell{ 1, 1 };

    Grid a(31, 17, U'#');
    Grid b(31, 17, U'#');
    RNG ra(2024u);
    RNG rb(2024u);
    generateMaze(a, ra, p);
    generateMaze(b, rb, p);
    expect(a == b, "same seed must produce identical mazes");
    expect(a.rows() == b.rows(), "same seed must produce identical rendered rows");

    Grid c(31, 17, U'#');
    RNG rc(2025u);
    generateMaze(c, rc, p);
    expect(a != c, "different seeds should produce different mazes");
}

void test_maze_perfect() {
    const int sizes[][2] = { {21, 11}, {30, 16}, {7, 7}, {40, 9} };
    for (const auto& sz : sizes) {
        for (uint32_t seed = 1; seed <= 8; ++seed) {
            Grid g(sz[0], sz[1], U'#');
            RNG rng(seed * 7919u);
            MazeParams p;
            const MazeResult r = generateMaze(g, rng, p);
            const std::string tag = std::to_string(sz[0]) + "x" + std::to_string(sz[1]) + " seed " + std::to_string(seed);

            expect(r.carved, "maze carved: " + tag);
            expect(r.start.row % 2 == 1 && r.start.col % 2 == 1, "random start on the odd lattice: " + tag);

            const FloorStats s = floorStats(g, U'.', r.start);
            expect(s.nodes == r.floorCells, "floor count matches result: " + tag);
            expect(s.reachable == s.nodes, "every floor cell reachable from start: " + tag);
            expect(s.edges == s.nodes - 1, "floor graph is a tree: " + tag);
            expect(borderIsWall(g, U'#'), "border stays wall: " + tag);

            // Every lattice cell gets visited on a fully walled grid.
            const int cellW = (sz[0] - 1) / 2;
            const int cellH = (sz[1] - 1) / 2;
            expect(s.nodes == 2 * cellW * cellH - 1, "lattice fully carved: " + tag);
        }
    }
}

void test_maze_5x5_scenario() {
    Grid g(5, 5, U'#');
    RNG rng(42u);
    MazeParams p;
    p.start = Cell{ 1, 1 };
    const MazeResult r = generateMaze(g, rng, p);

    expect(r.carved && r.start == Cell{ 1, 1 }, "5x5 keeps start (1,1)");
    expect(g.at(1, 1) == U'.', "start cell carved");
    expect(borderIsWall(g, U'#'), "5x5 border intact");

    const FloorStats s = floorStats(g, U'.', { 1, 1 });
    expect(s.nodes == 7, "5x5 maze has 4 lattice cells and 3 connectors");
    expect(s.reachable == s.nodes, "5x5 floor region connected to (1,1)");
    expect(g.at(2, 2) == U'#', "5x5 center pillar stays wall");
}

void test_maze_degenerate_inputs() {
    {
        Grid g(2, 2, U'#');
        RNG rng(1u);
        MazeParams p;
        p.start = Cell{ 0, 0 };
        const MazeResult r = generateMaze(g, rng, p);
        expect(!r.carved, "2x2 grid cannot be carved");
        expect(g.count(U'#') == 4, "2x2 grid untouched");
    }
    {
        Grid g(7, 1, U'#');
        RNG rng(1u);
        const MazeResult r = generateMaze(g, rng);
        expect(!r.carved && g.count(U'#') == 7, "single-row grid untouched");
    }
    {
        Grid g(3, 3, U'#');
        RNG rng(1u);
        MazeParams p;
        p.start = Cell{ 2, 2 };
        const MazeResult r = generateMaze(g, rng, p);
        expect(r.carved && r.start == Cell{ 1, 1 }, "3x3 even start snapped to (1,1)");
        expect(g.count(U'.') == 1, "3x3 maze is a single cell");
    }
    {
        Grid g(8, 6, U'#');
        Cell c{ 100, -5 };
        expect(clampMazeStart(g, c), "clampMazeStart accepts 8x6");
        expect(c == Cell{ 3, 1 }, "far start clamped to last odd interior cell");
        c = { 4, 6 };
        expect(clampMazeStart(g, c) && c == Cell{ 3, 5 }, "even start snapped down onto the lattice");
    }
    {
        Grid g(9, 9, U'?');
        RNG rng(9u);
        MazeParams p;
        p.clearToWall = true;
        generateMaze(g, rng, p);
        expect(g.count(U'?') == 0, "clearToWall resets every cell first");
    }
}

void test_blocked_move_scenario() {
    auto g = std::make_shared<Grid>(6, 5, U'.');
    (void)g->set(2, 3, U'#');

    Entity e = makeEntity(1, EntityKind::Player, g, { 2, 2 });
    const BlockerSet blockers = BlockerSet::fromText("#");
    const OccupancyIndex occ(g->width(), g->height());

    GridError err = GridError::None;
    expect(attemptMove(e, { 0, 1 }, blockers, occ, &err) == MoveResult::Blocked, "move into # is Blocked");
    expect(e.pos() == Cell{ 2, 2 }, "blocked move leaves position unchanged");
    expect(err == GridError::None, "blocker is not an error");

    expect(attemptMove(e, { -1, 0 }, blockers, occ) == MoveResult::Moved, "move onto floor succeeds");
    expect(e.pos() == Cell{ 1, 2 }, "moved entity updates position");

    expect(attemptMove(e, { 0, 0 }, blockers, occ) == MoveResult::Blocked, "zero delta is not a move");

    e.where = Placement{ g, { 0, 0 } };
    expect(attemptMove(e, { -1, 0 }, blockers, occ, &err) == MoveResult::Blocked, "leaving the grid is Blocked");
    expect(err == GridError::OutOfBounds, "leaving the grid reports OutOfBounds");
    expect(e.pos() == Cell{ 0, 0 }, "out-of-bounds move leaves position unchanged");
}

void test_bounds_envelope() {
    auto g = std::make_shared<Grid>(10, 10, U'.');
    Entity e = makeEntity(1, EntityKind::Element, g, { 2, 2 });
    e.bounds = CellRect{ 2, 2, 4, 4 };
    const BlockerSet none;
    const OccupancyIndex occ(10, 10);

    expect(attemptMove(e, { 0, -1 }, none, occ) == MoveResult::Blocked, "cannot leave envelope on the left");
    expect(attemptMove(e, { 2, 2 }, none, occ) == MoveResult::Moved, "inclusive max corner is inside");
    expect(e.pos() == Cell{ 4, 4 }, "moved to envelope corner");
    expect(attemptMove(e, { 1, 0 }, none, occ) == MoveResult::Blocked, "cannot pass inclusive max row");
}

void test_multi_cell_collision() {
    auto g = std::make_shared<Grid>(8, 6, U'.');
    (void)g->set(2, 5, U'#');

    Entity e = makeEntity(1, EntityKind::Element, g, { 1, 2 });
    e.art = Art::fromText("ab\ncd");
    const BlockerSet blockers = BlockerSet::fromText("#");
    const OccupancyIndex occ(8, 6);

    // Anchor (1,3) is clear but the art's bottom-right cell (2,4)->(2,5) is not.
    expect(attemptMove(e, { 0, 1 }, blockers, occ) == MoveResult::Moved, "2x2 art fits at (1,3)");
    expect(attemptMove(e, { 0, 1 }, blockers, occ) == MoveResult::Blocked, "2x2 art blocked by # under its corner");
    expect(e.pos() == Cell{ 1, 3 }, "blocked art stays put");

    // Art hanging off the right edge is clipped, not blocked.
    Entity edge = makeEntity(2, EntityKind::Element, g, { 4, 5 });
    edge.art = Art::fromText("xyz");
    expect(attemptMove(edge, { 0, 1 }, blockers, occ) == MoveResult::Moved, "clipped art cells are not checked");
}

void test_occupancy_rules() {
    auto g = makeGrid({
        "#####",
        "#...#",
        "#...#",
        "#####",
    });

    World w;
    expect(w.addLevel("room", g, BlockerSet::fromText("#")) != nullptr, "room level added");
    const int a = w.spawn(EntityKind::Npc, "room", { 1, 1 });
    const int b = w.spawn(EntityKind::Npc, "room", { 1, 2 });
    expect(a != 0 && b != 0 && a != b, "spawned two npcs");
    expect(g->at(1, 1) == U'N' && g->at(1, 2) == U'N', "npc glyphs drawn");

    TurnReport r = w.step(a, { 0, 1 });
    expect(r.result == MoveResult::Blocked, "npc cannot walk into another npc");
    expect(w.entity(a)->pos() == Cell{ 1, 1 }, "blocked npc stays");

    const Level* lv = w.level("room");
    expect(terrainAt(*g, lv->occupancy, { 1, 2 }) == U'.', "terrain under a drawn glyph is the recorded base");
    expect(lv->occupancy.occupied({ 1, 2 }) && !lv->occupancy.occupied({ 1, 2 }, b), "occupied ignores the asking entity");

    r = w.step(a, { 1, 0 });
    expect(r.result == MoveResult::Moved && g->at(1, 1) == U'.', "old cell restored after a move");
    expect(g->at(2, 1) == U'N', "new cell shows the glyph");

    // Glyphs that happen to be blocker symbols must not block their owner.
    Art hashArt = Art::single(U'#');
    const int c = w.spawn(EntityKind::Npc, "room", { 2, 3 }, &hashArt);
    expect(w.step(c, { -1, 0 }).result == MoveResult::Moved, "own # glyph does not block its owner");
    expect(g->at(2, 3) == U'.', "terrain restored under moved # glyph");

    expect(w.removeEntity(c), "removeEntity succeeds");
    expect(g->at(1, 3) == U'.', "removing an entity erases its glyph");
    expect(!w.removeEntity(c), "removing twice fails");

    // Elements may share cells with each other, but not with an npc.
    auto open = std::make_shared<Grid>(6, 6, U'.');
    OccupancyIndex occ(6, 6);
    Entity e1 = makeEntity(10, EntityKind::Element, open, { 2, 2 });
    Entity e2 = makeEntity(11, EntityKind::Element, open, { 2, 3 });
    Entity n = makeEntity(12, EntityKind::Npc, open, { 3, 2 });
    occ.insertCell(e1.id, e1.kind, e1.pos());
    occ.insertCell(n.id, n.kind, n.pos());
    expect(canEnter(*open, { 2, 2 }, BlockerSet(), occ, &e2), "element may overlap an element");
    expect(!canEnter(*open, { 3, 2 }, BlockerSet(), occ, &e2), "element may not overlap an npc");
    expect(!canEnter(*open, { 2, 2 }, BlockerSet(), occ), "anonymous check never shares");
    expect(!canEnter(*open, { 6, 0 }, BlockerSet(), occ), "out of bounds cannot be entered");
    occ.erase(e1.id);
    expect(canEnter(*open, { 2, 2 }, BlockerSet(), occ), "erased occupant frees its cell");
}

void test_place_remove_roundtrip() {
    auto g = makeGrid({
        "abcde",
        "fghij",
        "klmno",
        "pqrst",
    });
    const Grid before = *g;

    Entity e = makeEntity(1, EntityKind::Element, g, { 1, 1 });
    e.art = Art::fromText("12\n3 4");

    Footprint fp = placeEntity(*g, e);
    expect(fp.cells.size() == 4, "space in art is transparent");
    expect(g->row(1) == "f12ij", "art row 1 drawn");
    expect(g->row(2) == "k3m4o", "transparent cell keeps terrain");
    expect(fp.covers({ 2, 3 }) && !fp.covers({ 2, 2 }), "footprint covers drawn cells only");
    removeFootprint(*g, fp);
    expect(*g == before, "place then remove restores the grid exactly");

    // Clipping: only the in-bounds corner is drawn, deterministically.
    e.where = Placement{ g, { 3, 4 } };
    fp = placeEntity(*g, e);
    expect(fp.cells.size() == 1 && g->at(3, 4) == U'1', "art clipped at the bottom-right corner");
    const Footprint again = placeEntityAt(*g, e, { -1, -1 });
    expect(again.cells.size() == 1 && g->at(0, 1) == U'4', "art clipped at the top-left corner");
    removeFootprint(*g, again);
    removeFootprint(*g, fp);
    expect(*g == before, "clipped placements restore exactly");

    // Overlapping art from several entities unwinds in reverse order.
    Entity a = makeEntity(2, EntityKind::Element, g, { 0, 0 });
    a.art = Art::fromText("AAA");
    Entity b = makeEntity(3, EntityKind::Element, g, { 0, 1 });
    b.art = Art::fromText("BB\nBB");
    const std::vector<Footprint> stack = placeAll(*g, { &a, &b });
    expect(g->row(0) == "ABBde", "later art draws over earlier art");
    removeAll(*g, stack);
    expect(*g == before, "removeAll unwinds overlapping art");
}

void test_art_from_text() {
    const Art a = Art::fromText("\n /\\\n/__\\\n");
    expect(a.height() == 2, "leading and trailing empty lines dropped");
    expect(a.width() == 4, "art width is the longest line");
    expect(a.lines[0] == U" /\\", "art keeps leading spaces");

    const Art box = Art::fromText("╔╗\n╚╝");
    expect(box.width() == 2 && box.lines[1][1] == U'╝', "art decodes UTF-8");
}

void test_portal_transition_scenario() {
    auto a = std::make_shared<Grid>(6, 6, U'.');
    (void)a->set(4, 4, U'D');
    auto b = std::make_shared<Grid>(4, 4, U'.');

    World w;
    expect(w.addLevel("A", a, BlockerSet::fromText("#")) != nullptr, "level A");
    expect(w.addLevel("B", b, BlockerSet::fromText("#")) != nullptr, "level B");
    expect(w.addLevel("A", b, BlockerSet()) == nullptr, "duplicate level names rejected");

    std::string err;
    expect(w.linkPortal("A", U'D', "B", { 1, 1 }, "INTO B.", &err), "link A->B");
    expect(!w.linkPortal("A", U'E', "B", { 9, 9 }, "", &err), "spawn outside destination rejected");

    expect(w.spawnPlayer("A", { 4, 3 }) != 0, "player spawned");
    expect(a->at(4, 3) == U'X', "player drawn on A");

    SystemRegistry systems;
    auto observer = std::make_unique<PlacementObserver>(a.get());
    PlacementObserver* observerPtr = observer.get();
    systems.registerSystem("observer", std::move(observer));

    const TurnReport r = w.playTurn(Action::Right, systems);
    expect(r.result == MoveResult::Moved && r.transitioned, "stepping on D transitions");
    expect(r.level == "B" && r.pos == Cell{ 1, 1 }, "report names destination level and spawn");

    const Entity* p = w.player();
    expect(p && p->grid() == b && p->pos() == Cell{ 1, 1 }, "player references B at (1,1)");
    expect(!observerPtr->sawMixedState, "no observer saw grid A with the spawn position");
    expect(observerPtr->turns == 1 && observerPtr->lastTurn == 1, "systems updated once per turn");

    expect(a->at(4, 3) == U'.' && a->at(4, 4) == U'D', "player fully erased from A");
    expect(b->at(1, 1) == U'X', "player drawn on B");
    expect(w.level("A")->stack.empty() && w.level("B")->stack.size() == 1, "draw stacks follow the player");

    const std::vector<Message> msgs = w.drainMessages();
    expect(msgs.size() == 1 && msgs[0].text == "INTO B.", "arrival message logged");
    expect(w.messages().empty(), "drain empties the log");
}

void test_check_transition() {
    auto a = std::make_shared<Grid>(5, 5, U'.');
    (void)a->set(2, 2, U'D');
    auto b = std::make_shared<Grid>(3, 3, U'.');

    TransitionTable t;
    t.add(TransitionLink(U'D', b, { 1, 1 }));
    expect(checkTransition(*a, { 2, 2 }, t).has_value(), "portal symbol detected");
    expect(!checkTransition(*a, { 2, 3 }, t).has_value(), "plain floor is not a portal");
    expect(!checkTransition(*a, { 7, 7 }, t).has_value(), "out of bounds is not a portal");

    t.add(TransitionLink(U'D', a, { 0, 0 }));
    expect(t.links().size() == 1 && t.find(U'D')->targets(a.get()), "re-registering a symbol replaces the link");
    expect(t.removePortal(U'D') && t.empty(), "portal removed");
    expect(!t.removePortal(U'D'), "removing a missing portal fails");

    // Self-link: relocation happens once and never re-triggers.
    Entity e = makeEntity(1, EntityKind::Player, a, { 2, 2 });
    const TransitionLink self(U'D', a, { 4, 4 });
    GridError err = GridError::None;
    expect(applyTransition(self, e, &err) && err == GridError::None, "self-link applies");
    expect(e.grid() == a && e.pos() == Cell{ 4, 4 }, "self-link relocates on the same grid");

    const TransitionLink badSpawn(U'D', b, { 5, 5 });
    expect(!applyTransition(badSpawn, e, &err) && err == GridError::OutOfBounds, "spawn outside destination fails");
    expect(e.grid() == a && e.pos() == Cell{ 4, 4 }, "failed transition leaves the entity untouched");
}

void test_self_link_in_world() {
    auto g = makeGrid({
        ".....",
        ".SS..",
        ".....",
    });
    World w;
    expect(w.addLevel("loop", g, BlockerSet()) != nullptr, "loop level");
    expect(w.linkPortal("loop", U'S', "loop", { 1, 2 }), "self link");
    const int id = w.spawnPlayer("loop", { 1, 0 });

    const TurnReport r = w.step(id, { 0, 1 });
    expect(r.transitioned && r.pos == Cell{ 1, 2 }, "one transition per step even when spawn is a portal");
    expect(g->at(1, 1) == U'S' && g->at(1, 2) == U'X', "grid shows the player at the spawn");

    const TurnReport r2 = w.step(id, { 0, 1 });
    expect(!r2.transitioned && r2.pos == Cell{ 1, 3 }, "leaving the portal is a normal move");
    expect(g->at(1, 2) == U'S', "portal symbol restored under the player");
}

void test_dangling_transition() {
    auto a = std::make_shared<Grid>(5, 5, U'.');
    (void)a->set(2, 3, U'D');

    World w;
    expect(w.addLevel("A", a, BlockerSet()) != nullptr, "level A");
    expect(w.addLevel("B", std::make_shared<Grid>(4, 4, U'.'), BlockerSet()) != nullptr, "level B");
    expect(w.linkPortal("A", U'D', "B", { 1, 1 }), "link A->B");
    const int id = w.spawnPlayer("A", { 2, 2 });

    std::string err;
    expect(!w.discardLevel("A", &err), "cannot discard a level with entities on it");
    expect(w.discardLevel("B", &err), "discard B");
    expect(w.level("B") == nullptr, "B gone");
    expect(w.level("A")->transitions.find(U'D')->dangling(), "link into B now dangles");

    const TurnReport r = w.step(id, { 0, 1 });
    expect(r.error == GridError::DanglingTransition, "dangling link surfaced to the host");
    expect(!r.transitioned, "dangling link does not relocate");
    expect(w.player()->grid() == a && w.player()->pos() == Cell{ 2, 3 }, "player stays on A at the portal");
    expect(a->at(2, 3) == U'X', "player drawn over the dead portal");

    bool logged = false;
    for (const Message& m : w.messages()) {
        if (m.kind == MessageKind::System) logged = true;
    }
    expect(logged, "dangling link logged as a system message");

    // An entity whose own grid is gone reports the same error.
    auto orphanGrid = std::make_shared<Grid>(3, 3, U'.');
    Entity orphan = makeEntity(99, EntityKind::Npc, orphanGrid, { 1, 1 });
    orphanGrid.reset();
    GridError gerr = GridError::None;
    expect(attemptMove(orphan, { 0, 1 }, BlockerSet(), OccupancyIndex(), &gerr) == MoveResult::Blocked,
           "entity on a discarded grid cannot move");
    expect(gerr == GridError::DanglingTransition, "discarded grid reported as dangling");
}

void test_discarded_level_grid_still_held() {
    // The host keeps both grids alive for the whole session.
    auto a = std::make_shared<Grid>(5, 5, U'.');
    (void)a->set(2, 3, U'D');
    auto b = std::make_shared<Grid>(4, 4, U'.');

    World w;
    expect(w.addLevel("A", a, BlockerSet()) != nullptr, "level A");
    expect(w.addLevel("B", b, BlockerSet()) != nullptr, "level B");
    expect(w.linkPortal("A", U'D', "B", { 1, 1 }), "link A->B");
    const int id = w.spawnPlayer("A", { 2, 2 });

    std::string err;
    expect(w.discardLevel("B", &err), "discard B while the host holds its grid");

    const TurnReport r = w.step(id, { 0, 1 });
    expect(r.error == GridError::DanglingTransition, "link into a discarded level dangles even if its grid lives");
    expect(!r.transitioned && r.level == "A", "player not moved onto the discarded level");
    expect(w.player()->grid() == a && w.player()->pos() == Cell{ 2, 3 }, "player stays on A at the portal");
    expect(a->at(2, 3) == U'X', "player still drawn on A");
    expect(b->count(U'X') == 0, "nothing drawn on the discarded grid");

    const TurnReport back = w.step(id, { 0, -1 });
    expect(back.result == MoveResult::Moved && back.error == GridError::None, "player can walk off the dead portal");
    expect(a->at(2, 3) == U'D' && a->at(2, 2) == U'X', "portal restored once the player leaves");
}

void test_link_to_unhosted_grid() {
    auto a = std::make_shared<Grid>(5, 5, U'.');
    (void)a->set(2, 3, U'D');
    auto stray = std::make_shared<Grid>(3, 3, U'.');

    World w;
    Level* lv = w.addLevel("A", a, BlockerSet());
    expect(lv != nullptr, "level A");
    lv->transitions.add(TransitionLink(U'D', stray, { 1, 1 }));
    const int id = w.spawnPlayer("A", { 2, 2 });

    const TurnReport r = w.step(id, { 0, 1 });
    expect(r.error == GridError::DanglingTransition && !r.transitioned, "grid outside the world is not a destination");
    expect(w.player()->grid() == a && a->at(2, 3) == U'X', "player kept and drawn on A");
    expect(stray->count(U'X') == 0, "nothing drawn on the stray grid");

    w.drainMessages();
    const TurnReport next = w.step(id, { 1, 0 });
    expect(next.result == MoveResult::Moved && next.error == GridError::None, "player keeps moving on A");
    expect(w.messages().empty(), "no discarded-map report afterwards");
}

void test_portal_spawn_taken() {
    auto a = std::make_shared<Grid>(6, 6, U'.');
    (void)a->set(4, 4, U'D');
    auto b = std::make_shared<Grid>(4, 4, U'.');

    World w;
    expect(w.addLevel("A", a, BlockerSet::fromText("#")) != nullptr, "level A");
    expect(w.addLevel("B", b, BlockerSet::fromText("#")) != nullptr, "level B");
    expect(w.linkPortal("A", U'D', "B", { 1, 1 }), "link A->B");
    const int npc = w.spawn(EntityKind::Npc, "B", { 1, 1 });
    const int id = w.spawnPlayer("A", { 4, 3 });

    TurnReport r = w.step(id, { 0, 1 });
    expect(r.result == MoveResult::Blocked && !r.transitioned, "occupied spawn refuses the move");
    expect(r.error == GridError::None, "occupied spawn is not an error");
    expect(w.player()->grid() == a && w.player()->pos() == Cell{ 4, 3 }, "player stays where it was");
    expect(a->at(4, 3) == U'X' && a->at(4, 4) == U'D', "A unchanged");
    expect(b->at(1, 1) == U'N' && w.level("B")->occupancy.at({ 1, 1 }).size() == 1, "npc alone at the spawn");

    bool warned = false;
    for (const Message& m : w.messages()) {
        if (m.kind == MessageKind::Warning) warned = true;
    }
    expect(warned, "refused arrival logged as a warning");

    expect(w.removeEntity(npc), "npc removed");
    (void)b->set(1, 1, U'#');
    r = w.step(id, { 0, 1 });
    expect(r.result == MoveResult::Blocked && w.player()->pos() == Cell{ 4, 3 }, "blocker at the spawn refuses the move");

    (void)b->set(1, 1, U'.');
    r = w.step(id, { 0, 1 });
    expect(r.transitioned && r.level == "B" && b->at(1, 1) == U'X', "clear spawn lets the player through");
}

void test_world_player_slot() {
    World w;
    expect(w.addLevel("L", std::make_shared<Grid>(5, 5, U'.'), BlockerSet()) != nullptr, "level L");
    std::string err;
    expect(w.spawn(EntityKind::Npc, "nowhere", { 1, 1 }, nullptr, &err) == 0 && !err.empty(), "unknown level rejected");
    expect(w.spawn(EntityKind::Npc, "L", { 5, 1 }, nullptr, &err) == 0, "out-of-bounds spawn rejected");

    const int p1 = w.spawnPlayer("L", { 1, 1 });
    const int p2 = w.spawnPlayer("L", { 3, 3 });
    expect(p1 != p2 && w.playerId() == p2, "second player replaces the first");
    expect(w.entity(p1) == nullptr, "old player removed");
    expect(w.level("L")->grid->count(U'X') == 1, "only one player glyph drawn");

    SystemRegistry systems;
    const TurnReport r = w.playTurn(Action::Wait, systems);
    expect(r.result == MoveResult::Blocked && r.pos == Cell{ 3, 3 }, "wait does not move");
    expect(w.turn() == 1, "wait still consumes a turn");
}

class CountingSystem : public WorldSystem {
public:
    explicit CountingSystem(int* counter) : counter_(counter) {}
    void onTurn(TurnContext&) override { ++*counter_; }

private:
    int* counter_;
};

void test_system_registry() {
    int first = 0;
    int second = 0;
    SystemRegistry reg;
    reg.registerSystem("farm", std::make_unique<CountingSystem>(&first));
    reg.registerSystem("quests", std::make_unique<CountingSystem>(&second));
    expect(reg.size() == 2 && reg.get("farm") != nullptr, "systems registered");
    expect(reg.get("missing") == nullptr, "unknown system is null");

    World w;
    w.playTurn(Action::Wait, reg);
    expect(first == 1 && second == 1, "every system updated once");

    int replaced = 0;
    reg.registerSystem("farm", std::make_unique<CountingSystem>(&replaced));
    expect(reg.size() == 2, "same name replaces");
    w.playTurn(Action::Wait, reg);
    expect(first == 1 && replaced == 1 && second == 2, "replacement receives updates");

    expect(reg.unregisterSystem("quests") && !reg.unregisterSystem("quests"), "unregister once");
}

void test_editor() {
    GridEditor ed(12, 6);
    expect(ed.grid().row(0) == "╔══════════╗", "editor frame drawn");

    expect(ed.addElement("a", { 1, 1 }, Art::fromText("AA")), "add a");
    expect(ed.addElement("b", { 3, 5 }, Art::fromText("B\nB")), "add b");
    expect(!ed.addElement("a", { 2, 2 }, Art::single(U'Z')), "duplicate element id rejected");
    expect(!ed.addElement("wide", { 1, 1 }, Art::fromText("0123456789AB")), "art wider than the interior rejected");
    expect(!ed.addElement("c", { 4, 10 }, Art::fromText("CC")), "art hanging over the frame rejected");

    const Entity* a = ed.element("a");
    expect(a && a->bounds && a->bounds->maxRow == 4 && a->bounds->maxCol == 9, "art box confined to the interior");

    expect(ed.selected() == a, "first element selected");
    expect(!ed.apply(Action::Up), "cannot drag onto the frame");
    expect(ed.grid().row(0) == "╔══════════╗", "frame untouched");

    expect(ed.apply(Action::Down), "drag a down");
    expect(ed.grid().row(1) == "║..........║", "old position restored");
    expect(ed.grid().row(2) == "║AA........║", "new position drawn");

    ed.apply(Action::NextElement);
    expect(ed.selected() == ed.element("b"), "next selects b");
    ed.apply(Action::NextElement);
    expect(ed.selected() == ed.element("a"), "selection wraps forward");
    ed.apply(Action::PrevElement);
    expect(ed.selected() == ed.element("b"), "selection wraps backward");

    // Elements may overlap; moving one away restores the other.
    expect(ed.moveSelected({ -1, -3 }) == MoveResult::Moved, "b dragged onto a");
    expect(ed.grid().at(2, 2) == U'B', "b drawn over a");
    expect(ed.moveSelected({ 0, 4 }) == MoveResult::Moved, "b dragged off a");
    expect(ed.grid().row(2) == "║AA...B....║", "a visible again");

    expect(ed.removeElement("b"), "remove b");
    expect(ed.selectedIndex() == 0 && ed.selected() == ed.element("a"), "selection clamped after removal");
    expect(ed.grid().count(U'B') == 0, "removed element erased");
    expect(!ed.removeElement("b"), "removing twice fails");

    expect(ed.removeElement("a") && ed.selected() == nullptr, "empty editor has no selection");
    expect(ed.moveSelected({ 1, 0 }) == MoveResult::Blocked, "nothing to move");
    ed.selectNext();
    expect(ed.selectedIndex() == 0, "cycling an empty editor is a no-op");
}

void test_actions_parse() {
    expect(actioninfo::parse("right") == Action::Right, "canonical token");
    expect(actioninfo::parse(" D ") == Action::Right, "WASD alias, trimmed and case-folded");
    expect(actioninfo::parse("next-element") == Action::NextElement, "dash normalized");
    expect(!actioninfo::parse("dance").has_value(), "unknown token");

    std::vector<Action> list;
    std::string err;
    expect(actioninfo::parseList("up, up right  wait", list, &err), "list parsed");
    expect(list.size() == 4 && list[2] == Action::Right && list[3] == Action::Wait, "list order kept");
    expect(!actioninfo::parseList("up,jump", list, &err) && err.find("jump") != std::string::npos, "bad token named");

    expect(actionDelta(Action::Up) == Cell{ -1, 0 } && actionDelta(Action::Wait) == Cell{ 0, 0 }, "action deltas");
    expect(std::string(actioninfo::token(Action::PrevElement)) == "prev_element", "token lookup");
}

void test_grid_paths() {
    auto g = makeGrid({
        "#######",
        "#...#.#",
        "#.#.#.#",
        "#.#...#",
        "#######",
    });
    const BlockerSet walls = BlockerSet::fromText("#");

    const std::vector<int> dist = bfsDistanceMap(*g, { 1, 1 }, walls);
    expect(dist[static_cast<size_t>(1 * 7 + 5)] == 8, "distance around the wall");
    expect(dist[0] == -1, "walls unreachable");

    expect(farthestReachable(*g, { 1, 1 }, walls) == Cell{ 1, 5 }, "farthest cell");

    const std::vector<Cell> path = shortestPath(*g, { 1, 1 }, { 3, 1 }, walls);
    expect(path.size() == 3 && path.front() == Cell{ 1, 1 } && path.back() == Cell{ 3, 1 }, "shortest path");
    expect(shortestPath(*g, { 1, 1 }, { 0, 0 }, walls).empty(), "unreachable goal gives empty path");
}

void test_settings_load() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "termworld_settings_test.ini";

    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "maze_width = 3   ; too small, clamped\n";
        out << "MAZE_HEIGHT=25\n";
        out << "seed = 77\n";
        out << "wall_symbol = \"█\"\n";
        out << "floor_symbol = ab\n";
        out << "blockers = \"█#\"\n";
        out << "garbage line\n";
    }

    const Settings s = loadSettings(path.string());
    expect(s.mazeWidth == 5, "maze_width clamped");
    expect(s.mazeHeight == 25, "keys are case-insensitive");
    expect(s.seed == 77u, "seed parsed");
    expect(s.wallSymbol == U'█', "quoted UTF-8 symbol parsed");
    expect(s.floorSymbol == U'.', "multi-character symbol ignored");
    expect(s.blockers == "█#", "quoted blockers keep #");

    expect(writeDefaultSettings(path.string()), "default settings written");
    const Settings d = loadSettings(path.string());
    expect(d.mazeWidth == 41 && d.wallSymbol == U'#' && d.blockers == "#", "defaults round-trip");

    const Settings missing = loadSettings((fs::temp_directory_path() / "termworld_no_such_file.ini").string());
    expect(missing.mazeWidth == 41, "missing file gives defaults");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_utf8() {
    expect(utf8::decode("a═b").size() == 3, "multi-byte decode");
    expect(utf8::encode(utf8::decode("╔═╗")) == "╔═╗", "encode inverts decode");
    const std::u32string bad = utf8::decode(std::string("a\xC3", 2));
    expect(bad.size() == 2 && bad[1] == utf8::kReplacement, "truncated sequence replaced");
    const std::u32string cut = utf8::decode(std::string("\xE2" "a", 2));
    expect(cut.size() == 2 && cut[0] == utf8::kReplacement && cut[1] == U'a', "bytes after a truncated lead are kept");
    char32_t c = 0;
    expect(!utf8::decodeSymbol("ab", c) && utf8::decodeSymbol("║", c) && c == U'║', "single symbol decode");
}

} // namespace

int main() {
    std::cout << "Running TermWorld tests...\n";

    test_rng_reproducible();
    test_utf8();
    test_grid_bounds();
    test_grid_from_rows_shape();
    test_grid_frame();

    test_maze_deterministic();
    test_maze_perfect();
    test_maze_5x5_scenario();
    test_maze_degenerate_inputs();

    test_blocked_move_scenario();
    test_bounds_envelope();
    test_multi_cell_collision();
    test_occupancy_rules();

    test_place_remove_roundtrip();
    test_art_from_text();

    test_portal_transition_scenario();
    test_check_transition();
    test_self_link_in_world();
    test_dangling_transition();
    test_discarded_level_grid_still_held();
    test_link_to_unhosted_grid();
    test_portal_spawn_taken();
    test_world_player_slot();
    test_system_registry();

    test_editor();
    test_actions_parse();
    test_grid_paths();
    test_settings_load();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
