#pragma once

// Tagged commands exchanged between the host loop and the core.
//
// The host decodes keys (or menu selections, or script tokens) into an
// Action value and hands it to World::playTurn / GridEditor::apply. Nothing
// here holds a callback, so a queued command can be logged, compared and
// replayed.

#include "common.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Action : uint8_t {
    None = 0,

    // Movement
    Up,
    Down,
    Left,
    Right,

    Wait,

    // Editor
    NextElement,
    PrevElement,

    Quit,
};

namespace actioninfo {

struct ActionInfo {
    Action action;
    const char* token;
    const char* desc;
};

// NOTE: Order matters: it is used by the host's --help listing.
inline constexpr ActionInfo kActionInfoTable[] = {
    {Action::Up,    "up",    "Move north"},
    {Action::Down,  "down",  "Move south"},
    {Action::Left,  "left",  "Move west"},
    {Action::Right, "right", "Move east"},
    {Action::Wait,  "wait",  "Pass the turn"},

    {Action::NextElement, "next_element", "Select the next editor element"},
    {Action::PrevElement, "prev_element", "Select the previous editor element"},

    {Action::Quit, "quit", "Stop the host loop"},
};

inline const ActionInfo* find(Action a) {
    for (const auto& info : kActionInfoTable) {
        if (info.action == a) return &info;
    }
    return nullptr;
}

inline const ActionInfo* findByToken(std::string_view token) {
    for (const auto& info : kActionInfoTable) {
        if (token == info.token) return &info;
    }
    return nullptr;
}

inline const char* token(Action a) {
    if (const auto* info = find(a)) return info->token;
    return "";
}

inline const char* desc(Action a) {
    if (const auto* info = find(a)) return info->desc ? info->desc : "";
    return "";
}

inline std::string normalizeToken(std::string_view in) {
    size_t b = 0;
    size_t e = in.size();
    while (b < e && std::isspace(static_cast<unsigned char>(in[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(in[e - 1]))) --e;

    std::string s(in.substr(b, e - b));
    for (char& ch : s) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (ch == '-') ch = '_';
    }

    struct Alias { const char* alias; const char* canonical; };
    static constexpr Alias kAliases[] = {
        // WASD / vi-keys, so scripts read like key presses.
        {"w", "up"}, {"k", "up"}, {"north", "up"}, {"n", "up"},
        {"s", "down"}, {"j", "down"}, {"south", "down"},
        {"a", "left"}, {"h", "left"}, {"west", "left"},
        {"d", "right"}, {"l", "right"}, {"east", "right"},
        {".", "wait"},
        {"next", "next_element"}, {"tab", "next_element"},
        {"prev", "prev_element"}, {"previous", "prev_element"},
        {"q", "quit"}, {"exit", "quit"},
    };

    for (const auto& a : kAliases) {
        if (s == a.alias) return std::string(a.canonical);
    }
    return s;
}

inline std::optional<Action> parse(std::string_view in) {
    const std::string tok = normalizeToken(in);
    if (tok.empty()) return std::nullopt;

    if (const auto* info = findByToken(tok)) return info->action;
    return std::nullopt;
}

// Splits on commas and whitespace. Returns false (and names the bad token in
// `err`) if any token is unknown.
inline bool parseList(std::string_view in, std::vector<Action>& out, std::string* err = nullptr) {
    out.clear();
    size_t i = 0;
    while (i < in.size()) {
        while (i < in.size() && (in[i] == ',' || std::isspace(static_cast<unsigned char>(in[i])))) ++i;
        size_t j = i;
        while (j < in.size() && in[j] != ',' && !std::isspace(static_cast<unsigned char>(in[j]))) ++j;
        if (j > i) {
            const std::string_view tok = in.substr(i, j - i);
            const std::optional<Action> a = parse(tok);
            if (!a) {
                if (err) *err = "unknown action: " + std::string(tok);
                return false;
            }
            out.push_back(*a);
        }
        i = j;
    }
    return true;
}

} // namespace actioninfo

// Cell offset for movement actions, {0,0} for everything else.
inline Cell actionDelta(Action a) {
    switch (a) {
        case Action::Up:    return { -1, 0 };
        case Action::Down:  return { 1, 0 };
        case Action::Left:  return { 0, -1 };
        case Action::Right: return { 0, 1 };
        default:            return { 0, 0 };
    }
}

inline bool isMoveAction(Action a) {
    return a == Action::Up || a == Action::Down || a == Action::Left || a == Action::Right;
}
