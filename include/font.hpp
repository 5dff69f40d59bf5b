// font.hpp - built-in 3x5 LED font and the override map type
#pragma once
#include <array>
#include <cstdint>
#include <map>

// 5 rows of 3 columns, each cell 0 or 1
using Glyph = std::array<std::array<uint8_t, 3>, 5>;
using FontOverrides = std::map<char, Glyph>;

namespace font {
    static constexpr int GLYPH_W = 3;
    static constexpr int GLYPH_H = 5;

    // Case-insensitive lookup in the built-in table. Returns false for unknown characters.
    bool builtin_glyph(char ch, Glyph &out);

    // Uppercase ASCII letters, leave everything else untouched.
    char normalize(char ch);

    // True if every cell is 0 or 1.
    bool is_binary(const Glyph &g);

    Glyph blank();
}
