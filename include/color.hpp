// color.hpp - RGB colour type and the colour helpers shared by every screen
#pragma once
#include <cstdint>

constexpr uint8_t clamp_channel(int v) { return (uint8_t)(v < 0 ? 0 : (v > 255 ? 255 : v)); }

struct Color {
    uint8_t r = 0, g = 0, b = 0;
    constexpr Color() = default;
    constexpr Color(int rr, int gg, int bb) : r(clamp_channel(rr)), g(clamp_channel(gg)), b(clamp_channel(bb)) {}
    constexpr bool is_black() const { return r == 0 && g == 0 && b == 0; }
};

constexpr bool operator==(const Color &a, const Color &b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
constexpr bool operator!=(const Color &a, const Color &b) { return !(a == b); }

namespace colors {
    constexpr Color Black{0, 0, 0};
    constexpr Color White{255, 255, 255};
    constexpr Color Yellow{255, 255, 0};
    constexpr Color Cyan{0, 255, 255};
    constexpr Color Magenta{255, 0, 255};
    constexpr Color Red{255, 0, 0};
    constexpr Color Green{0, 255, 0};
}

class LEDGrid;

// Round half away from zero and clamp each channel to 0..255. NaN maps to 0.
Color color_from_floats(double r, double g, double b);

// h in degrees (0..360), s and v in 0..1. Channels are truncated, not rounded.
Color hsv_to_rgb(float h, float s, float v);

// Linear blend, truncated per channel. alpha 0 gives a, 1 gives b.
Color blend_colors(const Color &a, const Color &b, float alpha);

Color scale_color(const Color &c, float k);

// Light every cell within radius (inclusive) of (cx,cy).
void draw_circle_pixels(LEDGrid &grid, int cx, int cy, int radius, const Color &color);
