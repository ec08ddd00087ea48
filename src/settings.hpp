#pragma once

#include <cstdint>
#include <string>

// Simple user-editable settings file (INI-ish: key = value).
// The host creates it in its data directory (SDL_GetPrefPath) on first run.
struct Settings {
    // Maze level. Sizes are clamped to 5..199.
    int mazeWidth = 41;
    int mazeHeight = 21;

    // Hub level (framed room the maze portal leads to).
    int hubWidth = 30;
    int hubHeight = 12;

    // World seed. 0 picks a time-based seed at startup.
    uint32_t seed = 0;

    // Symbols (single code point each, UTF-8 in the file).
    char32_t wallSymbol = U'#';
    char32_t floorSymbol = U'.';
    char32_t playerSymbol = U'X';
    char32_t portalSymbol = U'D';
    char32_t returnSymbol = U'>';

    // Impassable symbols on the maze level, written as one UTF-8 string.
    std::string blockers = "#";
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
