#define SDL_MAIN_HANDLED
#include <SDL.h>

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "action.hpp"
#include "editor.hpp"
#include "grid_paths.hpp"
#include "maze.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "version.hpp"
#include "world.hpp"

namespace {

std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            const std::string v = argv[i + 1];
            if (v.empty()) return std::nullopt;
            uint64_t acc = 0;
            for (char c : v) {
                if (c < '0' || c > '9') return std::nullopt;
                acc = acc * 10 + static_cast<uint64_t>(c - '0');
                if (acc > 0xFFFFFFFFull) return std::nullopt;
            }
            return static_cast<uint32_t>(acc);
        }
    }
    return std::nullopt;
}

bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

void printUsage(const char* exe) {
    std::cout
        << TERMWORLD_APPNAME << " " << TERMWORLD_VERSION << "\n"
        << "Usage: " << (exe ? exe : "termworld") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Generate the world from a specific seed\n"
        << "  --moves <list>       Play a comma/space separated list of actions\n"
        << "  --solve              Walk the player to the maze portal\n"
        << "  --editor             Apply --moves to the element editor instead of the world\n"
        << "  --data-dir <path>    Override the config directory\n"
        << "  --portable           Store config next to the executable\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n"
        << "\nActions:\n";
    for (const auto& info : actioninfo::kActionInfoTable) {
        std::cout << "  " << info.token << std::string(16 - std::string(info.token).size(), ' ') << info.desc << "\n";
    }
}

void printGrid(const Grid& g) {
    for (const std::string& r : g.rows()) std::cout << r << "\n";
}

void printMessages(World& world) {
    for (const Message& m : world.drainMessages()) {
        std::ostream& out = (m.kind == MessageKind::System) ? std::cerr : std::cout;
        out << m.text;
        if (m.repeat > 1) out << " (x" << m.repeat << ")";
        out << "\n";
    }
}

// Counts what happened to the player over the session.
class TravelLog : public WorldSystem {
public:
    void onTurn(TurnContext& ctx) override {
        if (ctx.report.entityId != ctx.world.playerId()) return;
        if (ctx.report.result == MoveResult::Moved) moves++;
        else blocked++;
        if (ctx.report.transitioned) {
            transitions++;
            std::cout << "[turn " << ctx.turn << "] now on '" << ctx.report.level << "' at "
                      << cellToString(ctx.report.pos) << "\n";
        }
    }

    int moves = 0;
    int blocked = 0;
    int transitions = 0;
};

std::vector<Action> routeToActions(const std::vector<Cell>& path) {
    std::vector<Action> out;
    for (size_t i = 1; i < path.size(); ++i) {
        const int dr = path[i].row - path[i - 1].row;
        const int dc = path[i].col - path[i - 1].col;
        if (dr < 0) out.push_back(Action::Up);
        else if (dr > 0) out.push_back(Action::Down);
        else if (dc < 0) out.push_back(Action::Left);
        else if (dc > 0) out.push_back(Action::Right);
    }
    return out;
}

int runEditor(const std::vector<Action>& actions) {
    GridEditor editor(24, 10);
    const bool placed = editor.addElement("tree", { 2, 3 }, Art::fromText(R"(
 ^
/|\
 |
)")) && editor.addElement("house", { 2, 12 }, Art::fromText(R"(
 /\
/__\
|[]|
)"));
    if (!placed) {
        std::cerr << "Failed to place editor elements\n";
        return 1;
    }

    for (Action a : actions) {
        if (a == Action::Quit) break;
        if (!editor.apply(a) && isMoveAction(a)) {
            const Entity* sel = editor.selected();
            std::cerr << "Cannot move " << (sel ? sel->name : std::string("(nothing)")) << " "
                      << actioninfo::token(a) << "\n";
        }
    }

    if (const Entity* sel = editor.selected()) {
        std::cout << "Selected: " << sel->name << " at " << cellToString(sel->pos()) << "\n";
    }
    printGrid(editor.grid());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "termworld");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << TERMWORLD_APPNAME << " " << TERMWORLD_VERSION << "\n";
        return 0;
    }

    std::vector<Action> actions;
    if (const auto movesArg = parseStringArg(argc, argv, "--moves")) {
        std::string perr;
        if (!actioninfo::parseList(*movesArg, actions, &perr)) {
            std::cerr << "Invalid --moves: " << perr << "\n";
            return 2;
        }
    }

    if (hasFlag(argc, argv, "--editor")) {
        return runEditor(actions);
    }

    if (SDL_Init(SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Determine where to store settings.
    // By default we use a per-user writable directory (SDL_GetPrefPath), but this can be overridden.
    const std::optional<std::string> dataDirArg = parseStringArg(argc, argv, "--data-dir");
    const bool portable = hasFlag(argc, argv, "--portable");
    const bool resetSettings = hasFlag(argc, argv, "--reset-settings");

    std::filesystem::path baseDir;
    if (dataDirArg && !dataDirArg->empty()) {
        baseDir = std::filesystem::path(*dataDirArg);
    } else if (portable) {
        if (char* p = SDL_GetBasePath()) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    } else {
        if (char* p = SDL_GetPrefPath("termworld", TERMWORLD_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    }

    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) std::cerr << "Could not create " << baseDir.string() << ": " << ec.message() << "\n";
    }

    const std::filesystem::path settingsPathFs = baseDir / "termworld_settings.ini";
    const std::string settingsPath = settingsPathFs.string();

    if (resetSettings || !std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Failed to write settings: " << settingsPath << "\n";
        }
    }
    Settings settings = loadSettings(settingsPath);

    uint32_t seed = settings.seed;
    if (const auto seedArg = parseSeedArg(argc, argv)) seed = *seedArg;
    if (seed == 0) seed = hashCombine(static_cast<uint32_t>(std::time(nullptr)), SDL_GetTicks());

    // --- Maze level ---
    auto mazeGrid = std::make_shared<Grid>(settings.mazeWidth, settings.mazeHeight, settings.wallSymbol);
    RNG mazeRng(hashCombine(seed, "MAZE"_tag));

    MazeParams mp;
    mp.wall = settings.wallSymbol;
    mp.floor = settings.floorSymbol;
    mp.start = Cell{ 1, 1 };

    const uint64_t t0 = SDL_GetPerformanceCounter();
    const MazeResult maze = generateMaze(*mazeGrid, mazeRng, mp);
    const uint64_t t1 = SDL_GetPerformanceCounter();
    const double genMs = 1000.0 * static_cast<double>(t1 - t0) / static_cast<double>(SDL_GetPerformanceFrequency());

    if (!maze.carved) {
        std::cerr << "Maze too small to carve: " << settings.mazeWidth << "x" << settings.mazeHeight << "\n";
        SDL_Quit();
        return 1;
    }

    const BlockerSet mazeBlockers = BlockerSet::fromText(settings.blockers);
    const Cell portalCell = farthestReachable(*mazeGrid, maze.start, mazeBlockers);
    (void)mazeGrid->set(portalCell.row, portalCell.col, settings.portalSymbol);

    std::cout << "Seed " << seed << ": " << settings.mazeWidth << "x" << settings.mazeHeight << " maze, "
              << maze.floorCells << " floor cells, " << maze.deadEnds << " dead ends (" << genMs << " ms)\n";

    // --- Hub level ---
    auto hubGrid = std::make_shared<Grid>(settings.hubWidth, settings.hubHeight, settings.floorSymbol);
    const FrameStyle frame;
    hubGrid->drawFrame(settings.floorSymbol, frame);
    const Cell returnCell{ hubGrid->height() - 2, hubGrid->width() - 2 };
    (void)hubGrid->set(returnCell.row, returnCell.col, settings.returnSymbol);

    BlockerSet hubBlockers;
    for (char32_t s : { frame.horizontal, frame.vertical, frame.topLeft, frame.topRight, frame.bottomLeft,
                        frame.bottomRight }) {
        hubBlockers.add(s);
    }

    World world;
    std::string err;
    if (!world.addLevel("maze", mazeGrid, mazeBlockers, &err) || !world.addLevel("hub", hubGrid, hubBlockers, &err)) {
        std::cerr << err << "\n";
        SDL_Quit();
        return 1;
    }
    if (!world.linkPortal("maze", settings.portalSymbol, "hub", { 1, 1 }, "YOU STEP THROUGH THE DOOR INTO THE HUB.", &err) ||
        !world.linkPortal("hub", settings.returnSymbol, "maze", maze.start, "YOU RETURN TO THE MAZE.", &err)) {
        std::cerr << err << "\n";
        SDL_Quit();
        return 1;
    }

    const Art playerArt = Art::single(settings.playerSymbol);
    if (world.spawnPlayer("maze", maze.start, &playerArt, &err) == 0) {
        std::cerr << "Could not place player: " << err << "\n";
        SDL_Quit();
        return 1;
    }

    if (hasFlag(argc, argv, "--solve")) {
        const std::vector<Action> route = routeToActions(shortestPath(*mazeGrid, maze.start, portalCell, mazeBlockers));
        actions.insert(actions.begin(), route.begin(), route.end());
    }

    SystemRegistry systems;
    systems.registerSystem("travel_log", std::make_unique<TravelLog>());

    for (Action a : actions) {
        if (a == Action::Quit) break;
        const TurnReport rep = world.playTurn(a, systems);
        if (rep.error != GridError::None && rep.error != GridError::OutOfBounds) {
            std::cerr << "Turn " << world.turn() << ": " << gridErrorName(rep.error) << "\n";
        }
    }

    printMessages(world);

    if (const auto* log = dynamic_cast<const TravelLog*>(systems.get("travel_log"))) {
        std::cout << "Turns " << world.turn() << ": moved " << log->moves << ", blocked " << log->blocked
                  << ", transitions " << log->transitions << "\n";
    }

    if (const Entity* p = world.player()) {
        if (const std::shared_ptr<Grid> g = p->grid()) printGrid(*g);
    }

    SDL_Quit();
    return 0;
}
