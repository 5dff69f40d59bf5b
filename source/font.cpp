// font.cpp - built-in 3x5 glyph table
#include "font.hpp"

namespace font {

namespace {
    // Each row uses the low 3 bits (bit 2 = left column).
    struct PackedGlyph { char c; uint8_t rows[5]; };
    static const PackedGlyph kGlyphs[] = {
        {'0',{0x7,0x5,0x5,0x5,0x7}},
        {'1',{0x2,0x6,0x2,0x2,0x7}},
        {'2',{0x7,0x1,0x7,0x4,0x7}},
        {'3',{0x7,0x1,0x7,0x1,0x7}},
        {'4',{0x5,0x5,0x7,0x1,0x1}},
        {'5',{0x7,0x4,0x7,0x1,0x7}},
        {'6',{0x7,0x4,0x7,0x5,0x7}},
        {'7',{0x7,0x1,0x1,0x1,0x1}},
        {'8',{0x7,0x5,0x7,0x5,0x7}},
        {'9',{0x7,0x5,0x7,0x1,0x7}},
        {'A',{0x2,0x5,0x7,0x5,0x5}},
        {'B',{0x6,0x5,0x6,0x5,0x6}},
        {'C',{0x7,0x4,0x4,0x4,0x7}},
        {'D',{0x6,0x5,0x5,0x5,0x6}},
        {'E',{0x7,0x4,0x7,0x4,0x7}},
        {'F',{0x7,0x4,0x7,0x4,0x4}},
        {'G',{0x7,0x4,0x5,0x5,0x7}},
        {'H',{0x5,0x5,0x7,0x5,0x5}},
        {'I',{0x7,0x2,0x2,0x2,0x7}},
        {'J',{0x1,0x1,0x1,0x5,0x2}},
        {'K',{0x5,0x6,0x4,0x6,0x5}},
        {'L',{0x4,0x4,0x4,0x4,0x7}},
        {'M',{0x5,0x7,0x7,0x5,0x5}},
        {'N',{0x5,0x7,0x7,0x5,0x5}},
        {'O',{0x7,0x5,0x5,0x5,0x7}},
        {'P',{0x7,0x5,0x7,0x4,0x4}},
        {'Q',{0x7,0x5,0x5,0x7,0x1}},
        {'R',{0x7,0x5,0x7,0x6,0x5}},
        {'S',{0x7,0x4,0x7,0x1,0x7}},
        {'T',{0x7,0x2,0x2,0x2,0x2}},
        {'U',{0x5,0x5,0x5,0x5,0x7}},
        {'V',{0x5,0x5,0x5,0x5,0x2}},
        {'W',{0x5,0x5,0x7,0x7,0x5}},
        {'X',{0x5,0x5,0x2,0x5,0x5}},
        {'Y',{0x5,0x5,0x2,0x2,0x2}},
        {'Z',{0x7,0x1,0x2,0x4,0x7}},
        {' ',{0x0,0x0,0x0,0x0,0x0}},
        {'-',{0x0,0x0,0x7,0x0,0x0}},
    };
}

char normalize(char ch) {
    if (ch >= 'a' && ch <= 'z') return (char)(ch - 'a' + 'A');
    return ch;
}

bool builtin_glyph(char ch, Glyph &out) {
    ch = normalize(ch);
    for (const auto &pg : kGlyphs) {
        if (pg.c != ch) continue;
        for (int y = 0; y < GLYPH_H; ++y)
            for (int x = 0; x < GLYPH_W; ++x)
                out[y][x] = (pg.rows[y] >> (2 - x)) & 1;
        return true;
    }
    return false;
}

bool is_binary(const Glyph &g) {
    for (const auto &row : g)
        for (uint8_t v : row)
            if (v > 1) return false;
    return true;
}

Glyph blank() {
    Glyph g{};
    return g;
}

} // namespace font
