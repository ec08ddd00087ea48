#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>

// Compile-time tag hashing (FNV-1a), used to derive per-level seeds from the
// world seed without magic constants:
//   RNG mazeRng(hashCombine(worldSeed, "MAZE"_tag));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u;
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u;
    }
    return h;
}

constexpr uint32_t operator"" _tag(const char* str, std::size_t len) {
    return fnv1a32(str, len);
}

// Deterministic xorshift32 source. The maze generator only draws from this,
// so a fixed seed reproduces a level exactly on every platform.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Fisher-Yates, walking from the back. Part of the seeded contract:
    // changing the draw order changes every generated level.
    template <typename T, std::size_t N>
    void shuffle(T (&items)[N]) {
        for (int i = static_cast<int>(N) - 1; i > 0; --i) {
            const int j = range(0, i);
            std::swap(items[i], items[j]);
        }
    }
};

inline uint32_t hash32(uint32_t x) {
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}
