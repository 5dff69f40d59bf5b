// led_grid.hpp - 19x19 RGB LED panel: pixel buffer, text and display parameters
#pragma once
#include <array>
#include <string>
#include "color.hpp"
#include "font.hpp"
#include "layout.hpp"

class LEDGrid {
public:
    static constexpr int kSize = layout::GRID_SIZE;

    LEDGrid(int windowWidth = layout::TOP_SCREEN_W, int windowHeight = layout::TOP_SCREEN_H);

    // Display parameters -------------------------------------------------------
    void update_window_size(int windowWidth, int windowHeight);
    void adjust_led_size(int delta);
    void adjust_led_spacing(int delta);
    void adjust_led_gap(int delta);
    void toggle_style() { circular_ = !circular_; }
    void set_display(int ledSize, int ledSpacing, int ledGap, bool circular);

    int led_size() const { return ledSize_; }
    int led_spacing() const { return ledSpacing_; }
    int led_gap() const { return ledGap_; }
    bool circular() const { return circular_; }
    int window_width() const { return windowW_; }
    int window_height() const { return windowH_; }
    int offset_x() const { return offsetX_; }
    int offset_y() const { return offsetY_; }

    // Top-left screen position of LED (x,y)
    int led_origin_x(int x) const { return offsetX_ + x * (ledSize_ + ledSpacing_); }
    int led_origin_y(int y) const { return offsetY_ + y * (ledSize_ + ledSpacing_); }
    // Map a screen point (stylus) to a grid cell; false when outside the panel.
    bool screen_to_grid(int sx, int sy, int &gx, int &gy) const;

    // Pixels --------------------------------------------------------------------
    void set_pixel(int x, int y, const Color &color);
    void set_pixel(int x, int y, double r, double g, double b);
    Color get_pixel(int x, int y) const;
    void clear(const Color &color = colors::Black);
    void fill_rect(int x, int y, int width, int height, const Color &color);
    void draw_line(int x1, int y1, int x2, int y2, const Color &color);

    // Text ----------------------------------------------------------------------
    // Unknown characters are skipped without advancing. spacing is in unscaled pixels.
    void render_text(const std::string &text, int x, int y, const Color &color, int scale = 1, int spacing = 1);
    void render_number(int number, int x, int y, const Color &color, int scale = 1);
    void set_font_overrides(const FontOverrides &overrides) { overrides_ = overrides; }
    const FontOverrides &font_overrides() const { return overrides_; }
    // Override first, then built-in table.
    bool lookup_glyph(char ch, Glyph &out) const;

private:
    void update_grid_offset();

    std::array<std::array<Color, kSize>, kSize> pixels_{};
    int windowW_ = 0, windowH_ = 0;
    int ledSize_ = layout::LED_SIZE_DEFAULT;
    int ledSpacing_ = layout::LED_SPACING_DEFAULT;
    int ledGap_ = layout::LED_GAP_DEFAULT;
    bool circular_ = true;
    int offsetX_ = 0, offsetY_ = 0;
    FontOverrides overrides_;
};
