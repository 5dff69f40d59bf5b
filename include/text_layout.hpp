// text_layout.hpp - standard text zones on the 19x19 panel
#pragma once
#include <algorithm>

namespace text_layout {

struct TextZone { int x, y, w, h; };

constexpr TextZone TITLE{0, 0, 19, 5};
constexpr TextZone HINT{0, 14, 19, 5};
constexpr TextZone HUD_LEFT{0, 0, 9, 7};
constexpr TextZone HUD_RIGHT{10, 0, 9, 7};

// 3 wide plus spacing per character; spacing is unscaled.
inline int text_width(int chars, int scale = 1, int spacing = 1) {
    return chars * ((3 + spacing) * scale);
}

inline int centered_x(const TextZone &zone, int chars, int scale = 1, int spacing = 1) {
    int w = text_width(chars, scale, spacing);
    return zone.x + std::max(0, (zone.w - w) / 2);
}

} // namespace text_layout
