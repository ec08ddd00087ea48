#include "settings.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <utility>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) return false;
    long long acc = 0;
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        acc = acc * 10 + (s[i] - '0');
        if (acc > 0x7fffffffLL) return false;
    }
    out = static_cast<int>(s[0] == '-' ? -acc : acc);
    return true;
}

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    uint64_t acc = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        acc = acc * 10 + static_cast<uint64_t>(c - '0');
        if (acc > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(acc);
    return true;
}

// Symbols may be wrapped in quotes so that '#' and ';' survive comment stripping.
bool parseSymbol(const std::string& v, char32_t& out) {
    std::string s = trim(v);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') s = s.substr(1, s.size() - 2);
    return utf8::decodeSymbol(s, out);
}

// Strips a trailing # or ; comment, ignoring those inside double quotes.
std::string stripComment(const std::string& line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') quoted = !quoted;
        if (!quoted && (c == '#' || c == ';')) return line.substr(0, i);
    }
    return line;
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        line = trim(stripComment(line));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key == "maze_width") {
            int v = 0;
            if (parseInt(val, v)) s.mazeWidth = std::clamp(v, 5, 199);
        } else if (key == "maze_height") {
            int v = 0;
            if (parseInt(val, v)) s.mazeHeight = std::clamp(v, 5, 199);
        } else if (key == "hub_width") {
            int v = 0;
            if (parseInt(val, v)) s.hubWidth = std::clamp(v, 5, 199);
        } else if (key == "hub_height") {
            int v = 0;
            if (parseInt(val, v)) s.hubHeight = std::clamp(v, 5, 199);
        } else if (key == "seed") {
            uint32_t v = 0;
            if (parseU32(val, v)) s.seed = v;
        } else if (key == "wall_symbol") {
            char32_t c = 0;
            if (parseSymbol(val, c)) s.wallSymbol = c;
        } else if (key == "floor_symbol") {
            char32_t c = 0;
            if (parseSymbol(val, c)) s.floorSymbol = c;
        } else if (key == "player_symbol") {
            char32_t c = 0;
            if (parseSymbol(val, c)) s.playerSymbol = c;
        } else if (key == "portal_symbol") {
            char32_t c = 0;
            if (parseSymbol(val, c)) s.portalSymbol = c;
        } else if (key == "return_symbol") {
            char32_t c = 0;
            if (parseSymbol(val, c)) s.returnSymbol = c;
        } else if (key == "blockers") {
            std::string v = val;
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
            if (!v.empty()) s.blockers = v;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# TermWorld settings
#
# Lines are: key = value
# Comments start with # or ;
# Quote symbol values that are themselves # or ; (for example: wall_symbol = "#").

# Maze level size (5..199). Even sizes leave a double wall on the right/bottom.
maze_width = 41
maze_height = 21

# Hub level size (5..199)
hub_width = 30
hub_height = 12

# World seed (0 = time-based)
seed = 0

# Symbols (one character each)
wall_symbol = "#"
floor_symbol = "."
player_symbol = "X"
portal_symbol = "D"
return_symbol = ">"

# Impassable symbols on the maze level
blockers = "#"
)INI";

    return static_cast<bool>(f);
}
