// test_led_grid.cpp - colour coercion, text rendering, font overrides and display parameters
#include <gtest/gtest.h>
#include "led_grid.hpp"
#include "text_layout.hpp"

TEST(Color, FloatChannelsRoundAndClamp) {
    Color c = color_from_floats(12.7, -5.0, 9999.0);
    EXPECT_EQ(c.r, 13);
    EXPECT_EQ(c.g, 0);
    EXPECT_EQ(c.b, 255);
}

TEST(Color, IntConstructorClamps) {
    Color c(300, -1, 128);
    EXPECT_EQ(c, Color(255, 0, 128));
}

TEST(Color, HsvPrimaries) {
    EXPECT_EQ(hsv_to_rgb(0.0f, 1.0f, 1.0f), Color(255, 0, 0));
    EXPECT_EQ(hsv_to_rgb(120.0f, 1.0f, 1.0f), Color(0, 255, 0));
    EXPECT_EQ(hsv_to_rgb(240.0f, 1.0f, 1.0f), Color(0, 0, 255));
    EXPECT_TRUE(hsv_to_rgb(77.0f, 0.5f, 0.0f).is_black());
}

TEST(Color, BlendEndpoints) {
    EXPECT_EQ(blend_colors(colors::Black, colors::White, 0.0f), colors::Black);
    EXPECT_EQ(blend_colors(colors::Black, colors::White, 1.0f), colors::White);
}

TEST(LEDGrid, SetPixelClipsOutOfRange) {
    LEDGrid grid;
    grid.set_pixel(-1, 0, colors::White);
    grid.set_pixel(0, LEDGrid::kSize, colors::White);
    grid.set_pixel(LEDGrid::kSize - 1, LEDGrid::kSize - 1, colors::Red);
    EXPECT_EQ(grid.get_pixel(LEDGrid::kSize - 1, LEDGrid::kSize - 1), colors::Red);
    EXPECT_TRUE(grid.get_pixel(-1, 0).is_black());
    EXPECT_TRUE(grid.get_pixel(0, 0).is_black());
}

TEST(LEDGrid, FloatSetPixelCoerces) {
    LEDGrid grid;
    grid.set_pixel(2, 2, 12.7, -5.0, 9999.0);
    EXPECT_EQ(grid.get_pixel(2, 2), Color(13, 0, 255));
}

TEST(LEDGrid, DrawLineEndpoints) {
    LEDGrid grid;
    grid.draw_line(0, 0, 4, 4, colors::White);
    for (int i = 0; i <= 4; ++i) EXPECT_EQ(grid.get_pixel(i, i), colors::White);
    EXPECT_TRUE(grid.get_pixel(1, 0).is_black());
}

TEST(LEDGrid, TextAdvancesFourColumnsPerChar) {
    LEDGrid grid;
    grid.render_text("11", 0, 0, colors::White);
    // '1' has its stem in the middle column
    EXPECT_EQ(grid.get_pixel(1, 0), colors::White);
    EXPECT_EQ(grid.get_pixel(5, 0), colors::White);
    EXPECT_TRUE(grid.get_pixel(3, 2).is_black());
}

TEST(LEDGrid, UnknownCharactersDoNotAdvance) {
    LEDGrid a, b;
    a.render_text("1?1", 0, 0, colors::White);
    b.render_text("11", 0, 0, colors::White);
    for (int y = 0; y < LEDGrid::kSize; ++y)
        for (int x = 0; x < LEDGrid::kSize; ++x)
            EXPECT_EQ(a.get_pixel(x, y), b.get_pixel(x, y));
}

TEST(LEDGrid, TextIsCaseInsensitive) {
    LEDGrid a, b;
    a.render_text("abc", 1, 1, colors::White);
    b.render_text("ABC", 1, 1, colors::White);
    for (int y = 0; y < LEDGrid::kSize; ++y)
        for (int x = 0; x < LEDGrid::kSize; ++x)
            EXPECT_EQ(a.get_pixel(x, y), b.get_pixel(x, y));
}

TEST(LEDGrid, ScaledTextFillsBlocks) {
    LEDGrid grid;
    grid.render_text("1", 0, 0, colors::White, 2);
    EXPECT_EQ(grid.get_pixel(2, 0), colors::White);
    EXPECT_EQ(grid.get_pixel(3, 1), colors::White);
    EXPECT_TRUE(grid.get_pixel(0, 0).is_black());
}

TEST(LEDGrid, FontOverrideReplacesBuiltin) {
    LEDGrid grid;
    Glyph g = font::blank();
    g[0][1] = 1;
    FontOverrides overrides;
    overrides['A'] = g;
    grid.set_font_overrides(overrides);
    grid.render_text("A", 0, 0, colors::White);
    int lit = 0;
    for (int y = 0; y < font::GLYPH_H; ++y)
        for (int x = 0; x < font::GLYPH_W; ++x)
            if (!grid.get_pixel(x, y).is_black()) ++lit;
    EXPECT_EQ(lit, 1);
    EXPECT_EQ(grid.get_pixel(1, 0), colors::White);
}

TEST(LEDGrid, LowercaseUsesUppercaseOverride) {
    LEDGrid grid;
    Glyph g = font::blank();
    g[4][2] = 1;
    grid.set_font_overrides({{'B', g}});
    Glyph out;
    ASSERT_TRUE(grid.lookup_glyph('b', out));
    EXPECT_EQ(out, g);
}

TEST(LEDGrid, RenderNumber) {
    LEDGrid a, b;
    a.render_number(42, 3, 3, colors::Cyan);
    b.render_text("42", 3, 3, colors::Cyan);
    EXPECT_EQ(a.get_pixel(3, 3), b.get_pixel(3, 3));
    EXPECT_EQ(a.get_pixel(5, 7), b.get_pixel(5, 7));
}

TEST(LEDGrid, DisplayParametersClamp) {
    LEDGrid grid;
    for (int i = 0; i < 50; ++i) grid.adjust_led_size(1);
    EXPECT_EQ(grid.led_size(), layout::LED_SIZE_MAX);
    for (int i = 0; i < 50; ++i) grid.adjust_led_spacing(-1);
    EXPECT_EQ(grid.led_spacing(), layout::LED_SPACING_MIN);
    for (int i = 0; i < 50; ++i) grid.adjust_led_gap(1);
    EXPECT_EQ(grid.led_gap(), layout::LED_GAP_MAX);
    bool circ = grid.circular();
    grid.toggle_style();
    EXPECT_NE(grid.circular(), circ);
}

TEST(LEDGrid, ScreenToGridRoundTrip) {
    LEDGrid grid(layout::BOTTOM_SCREEN_W, layout::BOTTOM_SCREEN_H);
    int gx = -1, gy = -1;
    ASSERT_TRUE(grid.screen_to_grid(grid.led_origin_x(7) + 1, grid.led_origin_y(11) + 1, gx, gy));
    EXPECT_EQ(gx, 7);
    EXPECT_EQ(gy, 11);
    EXPECT_FALSE(grid.screen_to_grid(0, 0, gx, gy));
}

TEST(TextLayout, CentersInsideZone) {
    using namespace text_layout;
    EXPECT_EQ(text_width(5), 20);
    EXPECT_EQ(centered_x(TITLE, 5), 0);
    EXPECT_EQ(centered_x(TITLE, 2), 5);
    EXPECT_EQ(centered_x(HUD_RIGHT, 1), 12);
}
