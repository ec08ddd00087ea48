#pragma once

#include <string>

// Minimal UTF-8 <-> code point conversion for grid symbols.
//
// Map rows and element art arrive as UTF-8 text (box-drawing borders are
// multi-byte), but every grid cell holds exactly one code point. Malformed
// sequences decode to U+FFFD so a bad byte never shifts a row's width by more
// than one cell.

namespace utf8 {

constexpr char32_t kReplacement = 0xFFFD;

inline std::u32string decode(const std::string& in) {
    std::u32string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        const unsigned char c = static_cast<unsigned char>(in[i]);
        int extra = 0;
        char32_t cp = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        // Truncated sequence at the end of the input: replace the lead byte
        // and keep decoding whatever follows it.
        if (i + static_cast<size_t>(extra) >= in.size()) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool ok = true;
        for (int k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(in[i + static_cast<size_t>(k)]);
            if ((cc & 0xC0) != 0x80) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!ok) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }
    return out;
}

inline void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        append(out, kReplacement);
    }
}

inline std::string encode(const std::u32string& in) {
    std::string out;
    out.reserve(in.size());
    for (char32_t cp : in) append(out, cp);
    return out;
}

inline std::string encode(char32_t cp) {
    std::string out;
    append(out, cp);
    return out;
}

// Decodes a single-symbol setting value ("#", "═"). Returns false unless the
// text is exactly one code point.
inline bool decodeSymbol(const std::string& in, char32_t& out) {
    const std::u32string s = decode(in);
    if (s.size() != 1) return false;
    out = s[0];
    return true;
}

} // namespace utf8
