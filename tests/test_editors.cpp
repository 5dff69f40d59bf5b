// test_editors.cpp - font atlas and glyph editing, sprite and menu-card painting
#include <gtest/gtest.h>
#include <string>
#include "font_editor.hpp"
#include "overlay_editor.hpp"
#include "font_store.hpp"
#include "sprite_store.hpp"
#include "led_grid.hpp"

namespace {
    std::string temp_file(const char* name) {
        return ::testing::TempDir() + "gridarcade_editor_" + name;
    }

    InputState touch_at(const LEDGrid &grid, int gx, int gy) {
        InputState in;
        in.touching = in.touchPressed = true;
        in.stylusX = grid.led_origin_x(gx) + 1;
        in.stylusY = grid.led_origin_y(gy) + 1;
        return in;
    }
}

TEST(FontEditor, AtlasCellsSkipGutters) {
    LEDGrid grid;
    FontStore store(temp_file("atlas.json"));
    FontEditor ed(grid, store);
    char c = 0;
    ASSERT_TRUE(ed.atlas_char_at(0, 0, c));
    EXPECT_EQ(c, 'A');
    ASSERT_TRUE(ed.atlas_char_at(4, 0, c));
    EXPECT_EQ(c, 'B');
    ASSERT_TRUE(ed.atlas_char_at(2, 10, c));
    EXPECT_EQ(c, 'E');
    EXPECT_FALSE(ed.atlas_char_at(3, 0, c));
    EXPECT_FALSE(ed.atlas_char_at(0, 5, c));
    EXPECT_FALSE(ed.atlas_char_at(16, 0, c));
}

TEST(FontEditor, PagesFollowSelection) {
    LEDGrid grid;
    FontStore store(temp_file("pages.json"));
    FontEditor ed(grid, store);
    EXPECT_EQ(ed.page_count(), 4);
    ed.select_index(12);
    EXPECT_EQ(ed.atlas_page, 1);
    char c = 0;
    ASSERT_TRUE(ed.atlas_char_at(0, 0, c));
    EXPECT_EQ(c, 'M');
    ed.select_index(999);
    EXPECT_EQ(ed.current_char(), '-');
}

TEST(FontEditor, JumpOpensBuiltinGlyph) {
    LEDGrid grid;
    FontStore store(temp_file("jump.json"));
    FontEditor ed(grid, store);
    ASSERT_TRUE(ed.jump_to('b'));
    EXPECT_EQ(ed.mode, FontEditor::Mode::Edit);
    EXPECT_EQ(ed.current_char(), 'B');
    Glyph builtin;
    ASSERT_TRUE(font::builtin_glyph('B', builtin));
    EXPECT_EQ(ed.glyph, builtin);
    EXPECT_FALSE(ed.jump_to('?'));
}

TEST(FontEditor, SaveAndResetGlyph) {
    LEDGrid grid;
    FontStore store(temp_file("save.json"));
    FontEditor ed(grid, store, 'A');
    Glyph builtin = ed.glyph;
    ed.toggle_cell(0, 0);
    EXPECT_NE(ed.glyph, builtin);
    EXPECT_EQ(ed.preview_overrides().at('A'), ed.glyph);
    EXPECT_TRUE(store.get_overrides().empty());

    ed.save_glyph();
    Glyph stored;
    ASSERT_TRUE(store.get_glyph('A', stored));
    EXPECT_EQ(stored, ed.glyph);

    ed.reset_glyph();
    EXPECT_FALSE(store.get_glyph('A', stored));
    EXPECT_EQ(ed.glyph, builtin);
}

TEST(FontEditor, GlyphCellsAreMagnified) {
    LEDGrid grid;
    FontStore store(temp_file("zoom.json"));
    FontEditor ed(grid, store);
    int cx = -1, cy = -1;
    ASSERT_TRUE(ed.glyph_cell_at(1, 1, cx, cy));
    EXPECT_EQ(cx, 0); EXPECT_EQ(cy, 0);
    ASSERT_TRUE(ed.glyph_cell_at(9, 15, cx, cy));
    EXPECT_EQ(cx, 2); EXPECT_EQ(cy, 4);
    EXPECT_FALSE(ed.glyph_cell_at(10, 1, cx, cy));
    EXPECT_FALSE(ed.glyph_cell_at(0, 1, cx, cy));
}

TEST(FontEditor, TouchInAtlasOpensGlyph) {
    LEDGrid grid(layout::BOTTOM_SCREEN_W, layout::BOTTOM_SCREEN_H);
    FontStore store(temp_file("touch.json"));
    FontEditor ed(grid, store);
    ed.handle_input(touch_at(grid, 5, 7));
    EXPECT_EQ(ed.mode, FontEditor::Mode::Edit);
    EXPECT_EQ(ed.current_char(), 'F');
}

TEST(FontEditor, RenderPreviewsUnsavedGlyph) {
    LEDGrid grid;
    FontStore store(temp_file("preview.json"));
    FontEditor ed(grid, store, 'A');
    ed.glyph = font::blank();
    ed.render();
    Glyph g;
    ASSERT_TRUE(grid.lookup_glyph('A', g));
    EXPECT_EQ(g, font::blank());
}

TEST(OverlayEditor, TargetsAndPainting) {
    LEDGrid grid;
    SpriteStore store(temp_file("overlay.json"));
    OverlayEditor ed(grid, store, 1);
    ASSERT_EQ(ed.targets.size(), 3u);
    EXPECT_EQ(ed.target().name, "menu_logo_SNAKE");
    EXPECT_EQ(ed.sprite().w, 11);
    EXPECT_EQ(ed.sprite().h, 8);

    ed.cursor_x = 2; ed.cursor_y = 3;
    ed.palette_index = 2;
    ed.paint();
    Color c;
    ASSERT_TRUE(store.get("menu_logo_SNAKE")->get(2, 3, c));
    EXPECT_EQ(c, editor_palette::colors()[2]);
    ed.erase();
    EXPECT_FALSE(store.get("menu_logo_SNAKE")->get(2, 3, c));
}

TEST(OverlayEditor, TargetCycleClampsCursor) {
    LEDGrid grid;
    SpriteStore store(temp_file("cycle.json"));
    OverlayEditor ed(grid, store, 7);
    ed.cursor_x = 10; ed.cursor_y = 7;
    InputState in;
    in.yPressed = true;
    ed.handle_input(in);
    EXPECT_EQ(ed.target().name, "hud_race_dist");
    EXPECT_EQ(ed.cursor_x, 2);
    EXPECT_EQ(ed.cursor_y, 4);
    ed.select_target(3);
    EXPECT_EQ(ed.target_index, 0);
    ed.select_target(-1);
    EXPECT_EQ(ed.target().name, "hud_race_score");
}

TEST(OverlayEditor, PaletteCycles) {
    LEDGrid grid;
    SpriteStore store(temp_file("palette.json"));
    OverlayEditor ed(grid, store, 0);
    InputState in;
    in.xPressed = true;
    for (int i = 0; i < editor_palette::kSize; ++i) ed.handle_input(in);
    EXPECT_EQ(ed.palette_index, 0);
}

TEST(OverlayEditor, SpriteCellsOffsetByFrame) {
    LEDGrid grid;
    SpriteStore store(temp_file("cells.json"));
    OverlayEditor ed(grid, store, 0);
    int sx, sy;
    ASSERT_TRUE(ed.sprite_cell_at(1, 1, sx, sy));
    EXPECT_EQ(sx, 0); EXPECT_EQ(sy, 0);
    EXPECT_FALSE(ed.sprite_cell_at(12, 1, sx, sy));
    EXPECT_FALSE(ed.sprite_cell_at(0, 0, sx, sy));
}

TEST(MenuCardEditor, BakeCopiesCard) {
    LEDGrid grid;
    SpriteStore store(temp_file("bake.json"));
    MenuCardEditor ed(grid, store, 0);
    EXPECT_EQ(ed.sprite_name(), "menu_card_PONG");
    ed.sprite().set(1, 10, colors::Red);
    ed.bake_from_base();
    Color c;
    // Card border row sits at grid y 4
    ASSERT_TRUE(ed.sprite().get(0, 4 - MenuCardEditor::kTop, c));
    EXPECT_EQ(c, Color(30, 30, 40));
    EXPECT_FALSE(ed.sprite().get(1, 10, c));
}

TEST(MenuCardEditor, TouchOnPaletteRowSelectsColour) {
    LEDGrid grid(layout::BOTTOM_SCREEN_W, layout::BOTTOM_SCREEN_H);
    SpriteStore store(temp_file("card_touch.json"));
    MenuCardEditor ed(grid, store, 2);
    ed.handle_input(touch_at(grid, 4, 0));
    EXPECT_EQ(ed.palette_index, 4);
    EXPECT_TRUE(ed.sprite().pixels.empty());

    ed.handle_input(touch_at(grid, 6, 9));
    Color c;
    ASSERT_TRUE(ed.sprite().get(6, 9 - MenuCardEditor::kTop, c));
    EXPECT_EQ(c, editor_palette::colors()[4]);
}
