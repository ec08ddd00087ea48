#include "entity.hpp"
#include "utf8.hpp"

#include <algorithm>

namespace {

const EntityTraits kTraits[] = {
    { EntityKind::Player,  "player",  U'X', false, true },
    { EntityKind::Npc,     "npc",     U'N', false, false },
    { EntityKind::Element, "element", U'*', true,  false },
};

} // namespace

const EntityTraits& entityTraits(EntityKind k) {
    const size_t i = static_cast<size_t>(k);
    if (i < sizeof(kTraits) / sizeof(kTraits[0])) return kTraits[i];
    return kTraits[static_cast<size_t>(EntityKind::Npc)];
}

int Art::width() const {
    int w = 0;
    for (const auto& l : lines) w = std::max(w, static_cast<int>(l.size()));
    return w;
}

Art Art::single(char32_t glyph) {
    Art a;
    a.lines.push_back(std::u32string(1, glyph));
    return a;
}

Art Art::fromText(const std::string& text) {
    Art a;
    size_t begin = 0;
    while (true) {
        const size_t nl = text.find('\n', begin);
        if (nl == std::string::npos) {
            a.lines.push_back(utf8::decode(text.substr(begin)));
            break;
        }
        a.lines.push_back(utf8::decode(text.substr(begin, nl - begin)));
        begin = nl + 1;
    }

    if (!a.lines.empty() && a.lines.front().empty()) a.lines.erase(a.lines.begin());
    if (!a.lines.empty() && a.lines.back().empty()) a.lines.pop_back();
    return a;
}

bool Entity::isOn(const Grid* g) const {
    const std::shared_ptr<Grid> mine = grid();
    return mine && mine.get() == g;
}

std::vector<Cell> Entity::footprintCells(const Cell& anchor) const {
    std::vector<Cell> out;
    for (int y = 0; y < art.height(); ++y) {
        const std::u32string& line = art.lines[static_cast<size_t>(y)];
        for (int x = 0; x < static_cast<int>(line.size()); ++x) {
            if (line[static_cast<size_t>(x)] == U' ') continue;
            out.push_back({ anchor.row + y, anchor.col + x });
        }
    }
    return out;
}

Entity makeEntity(int id, EntityKind kind, const std::shared_ptr<Grid>& grid, Cell pos) {
    Entity e;
    e.id = id;
    e.kind = kind;
    e.name = entityTraits(kind).name;
    e.where = Placement{ grid, pos };
    e.art = Art::single(entityTraits(kind).defaultGlyph);
    return e;
}
