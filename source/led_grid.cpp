// led_grid.cpp - LED panel buffer, text rasterizer and display geometry
#include <algorithm>
#include <cstdlib>
#include "led_grid.hpp"

LEDGrid::LEDGrid(int windowWidth, int windowHeight) {
    update_window_size(windowWidth, windowHeight);
}

void LEDGrid::update_window_size(int windowWidth, int windowHeight) {
    windowW_ = windowWidth;
    windowH_ = windowHeight;
    update_grid_offset();
}

void LEDGrid::update_grid_offset() {
    int total = (ledSize_ + ledSpacing_) * kSize - ledSpacing_;
    offsetX_ = (windowW_ - total) / 2;
    offsetY_ = (windowH_ - total) / 2;
}

void LEDGrid::adjust_led_size(int delta) {
    ledSize_ = std::max(layout::LED_SIZE_MIN, std::min(layout::LED_SIZE_MAX, ledSize_ + delta));
    update_grid_offset();
}

void LEDGrid::adjust_led_spacing(int delta) {
    ledSpacing_ = std::max(layout::LED_SPACING_MIN, std::min(layout::LED_SPACING_MAX, ledSpacing_ + delta));
    update_grid_offset();
}

void LEDGrid::adjust_led_gap(int delta) {
    ledGap_ = std::max(layout::LED_GAP_MIN, std::min(layout::LED_GAP_MAX, ledGap_ + delta));
}

void LEDGrid::set_display(int ledSize, int ledSpacing, int ledGap, bool circular) {
    ledSize_ = std::max(layout::LED_SIZE_MIN, std::min(layout::LED_SIZE_MAX, ledSize));
    ledSpacing_ = std::max(layout::LED_SPACING_MIN, std::min(layout::LED_SPACING_MAX, ledSpacing));
    ledGap_ = std::max(layout::LED_GAP_MIN, std::min(layout::LED_GAP_MAX, ledGap));
    circular_ = circular;
    update_grid_offset();
}

bool LEDGrid::screen_to_grid(int sx, int sy, int &gx, int &gy) const {
    int pitch = ledSize_ + ledSpacing_;
    if (pitch <= 0) return false;
    int rx = sx - offsetX_, ry = sy - offsetY_;
    if (rx < 0 || ry < 0) return false;
    gx = rx / pitch;
    gy = ry / pitch;
    return gx >= 0 && gx < kSize && gy >= 0 && gy < kSize;
}

void LEDGrid::set_pixel(int x, int y, const Color &color) {
    if (x < 0 || x >= kSize || y < 0 || y >= kSize) return;
    pixels_[y][x] = color;
}

void LEDGrid::set_pixel(int x, int y, double r, double g, double b) {
    set_pixel(x, y, color_from_floats(r, g, b));
}

Color LEDGrid::get_pixel(int x, int y) const {
    if (x < 0 || x >= kSize || y < 0 || y >= kSize) return colors::Black;
    return pixels_[y][x];
}

void LEDGrid::clear(const Color &color) {
    for (auto &row : pixels_) row.fill(color);
}

void LEDGrid::fill_rect(int x, int y, int width, int height, const Color &color) {
    for (int dy = 0; dy < height; ++dy)
        for (int dx = 0; dx < width; ++dx)
            set_pixel(x + dx, y + dy, color);
}

void LEDGrid::draw_line(int x1, int y1, int x2, int y2, const Color &color) {
    int dx = std::abs(x2 - x1), dy = std::abs(y2 - y1);
    int sx = x1 < x2 ? 1 : -1, sy = y1 < y2 ? 1 : -1;
    int err = dx - dy;
    int x = x1, y = y1;
    while (true) {
        set_pixel(x, y, color);
        if (x == x2 && y == y2) break;
        int e2 = 2 * err;
        if (e2 > -dy) { err -= dy; x += sx; }
        if (e2 < dx) { err += dx; y += sy; }
    }
}

bool LEDGrid::lookup_glyph(char ch, Glyph &out) const {
    ch = font::normalize(ch);
    auto it = overrides_.find(ch);
    if (it != overrides_.end()) { out = it->second; return true; }
    return font::builtin_glyph(ch, out);
}

void LEDGrid::render_text(const std::string &text, int x, int y, const Color &color, int scale, int spacing) {
    int cursorX = x;
    int advance = font::GLYPH_W * scale + std::max(0, spacing) * scale;
    for (char c : text) {
        Glyph g;
        if (!lookup_glyph(c, g)) continue;
        for (int row = 0; row < font::GLYPH_H; ++row) {
            for (int col = 0; col < font::GLYPH_W; ++col) {
                if (!g[row][col]) continue;
                for (int sy = 0; sy < scale; ++sy)
                    for (int sx = 0; sx < scale; ++sx)
                        set_pixel(cursorX + col * scale + sx, y + row * scale + sy, color);
            }
        }
        cursorX += advance;
    }
}

void LEDGrid::render_number(int number, int x, int y, const Color &color, int scale) {
    render_text(std::to_string(number), x, y, color, scale);
}
