// color.cpp - colour conversions and blending
#include <cmath>
#include "color.hpp"
#include "led_grid.hpp"

static int coerce_channel(double v) {
    if (std::isnan(v)) return 0;
    if (v >= 255.0) return 255;
    if (v <= 0.0) return 0;
    return (int)std::lround(v);
}

Color color_from_floats(double r, double g, double b) {
    return Color(coerce_channel(r), coerce_channel(g), coerce_channel(b));
}

Color hsv_to_rgb(float h, float s, float v) {
    float hh = h / 360.0f;
    float r = v, g = v, b = v;
    if (s > 0.0f) {
        int i = (int)std::floor(hh * 6.0f);
        float f = hh * 6.0f - (float)i;
        float p = v * (1.0f - s);
        float q = v * (1.0f - s * f);
        float t = v * (1.0f - s * (1.0f - f));
        i %= 6; if (i < 0) i += 6;
        switch (i) {
            case 0: r = v; g = t; b = p; break;
            case 1: r = q; g = v; b = p; break;
            case 2: r = p; g = v; b = t; break;
            case 3: r = p; g = q; b = v; break;
            case 4: r = t; g = p; b = v; break;
            default: r = v; g = p; b = q; break;
        }
    }
    return Color((int)(r * 255.0f), (int)(g * 255.0f), (int)(b * 255.0f));
}

Color blend_colors(const Color &a, const Color &b, float alpha) {
    float ia = 1.0f - alpha;
    return Color((int)(a.r * ia + b.r * alpha),
                 (int)(a.g * ia + b.g * alpha),
                 (int)(a.b * ia + b.b * alpha));
}

Color scale_color(const Color &c, float k) {
    return Color((int)(c.r * k), (int)(c.g * k), (int)(c.b * k));
}

void draw_circle_pixels(LEDGrid &grid, int cx, int cy, int radius, const Color &color) {
    for (int y = cy - radius; y <= cy + radius; ++y) {
        for (int x = cx - radius; x <= cx + radius; ++x) {
            float dx = (float)(x - cx), dy = (float)(y - cy);
            if (std::sqrt(dx * dx + dy * dy) <= (float)radius) grid.set_pixel(x, y, color);
        }
    }
}
