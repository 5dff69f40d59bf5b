// test_stores.cpp - sprites.json / font_overrides.json persistence and options.cfg parsing
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "sprite_store.hpp"
#include "font_store.hpp"
#include "storage.hpp"
#include "led_grid.hpp"
#include "options.hpp"
#include "sound.hpp"
#include "hardware.hpp"
#include "ui_button.hpp"

namespace {
    std::string temp_file(const char* name) {
        return ::testing::TempDir() + "gridarcade_" + name;
    }
}

TEST(SpriteStore, SaveLoadKeepsPixels) {
    const std::string path = temp_file("sprites.json");
    {
        SpriteStore store(path);
        Sprite &s = store.get_or_create("menu_logo_PONG", 11, 8);
        s.set(0, 0, Color(255, 0, 0));
        s.set(10, 7, Color(1, 2, 3));
        ASSERT_TRUE(store.save());
    }
    SpriteStore loaded(path);
    ASSERT_TRUE(loaded.load());
    const Sprite* s = loaded.get("menu_logo_PONG");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->w, 11);
    EXPECT_EQ(s->h, 8);
    EXPECT_EQ(s->pixels.size(), 2u);
    Color c;
    ASSERT_TRUE(s->get(10, 7, c));
    EXPECT_EQ(c, Color(1, 2, 3));
}

TEST(SpriteStore, OutOfBoundsWritesIgnored) {
    Sprite s;
    s.w = 3; s.h = 5;
    s.set(3, 0, colors::White);
    s.set(0, -1, colors::White);
    EXPECT_TRUE(s.pixels.empty());
}

TEST(SpriteStore, GetOrCreateReplacesOnSizeChange) {
    SpriteStore store(temp_file("resize.json"));
    store.get_or_create("x", 3, 5).set(1, 1, colors::White);
    EXPECT_EQ(store.get_or_create("x", 3, 5).pixels.size(), 1u);
    Sprite &r = store.get_or_create("x", 4, 4);
    EXPECT_EQ(r.w, 4);
    EXPECT_TRUE(r.pixels.empty());
}

TEST(SpriteStore, MalformedFileLeavesStoreEmpty) {
    const std::string path = temp_file("bad_sprites.json");
    ASSERT_TRUE(storage::write_file(path, "{ not json"));
    SpriteStore store(path);
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.size(), 0u);
}

TEST(SpriteStore, BadEntriesSkipped) {
    const std::string path = temp_file("mixed_sprites.json");
    ASSERT_TRUE(storage::write_file(path,
        "{\"good\": {\"w\": 2, \"h\": 2, \"pixels\": {\"1,1\": [10,20,30]}},"
        " \"bad\": {\"w\": \"two\"}}"));
    SpriteStore store(path);
    ASSERT_TRUE(store.load());
    EXPECT_NE(store.get("good"), nullptr);
    EXPECT_EQ(store.get("bad"), nullptr);
}

TEST(SpriteStore, HugeNumbersClampOrSkip) {
    const std::string path = temp_file("huge_sprites.json");
    ASSERT_TRUE(storage::write_file(path,
        "{\"wide\": {\"w\": 1e20, \"h\": -1e20, \"pixels\": {}},"
        " \"bright\": {\"w\": 2, \"h\": 2, \"pixels\": {\"0,0\": [1e300, -1e300, 5]}},"
        " \"far\": {\"w\": 2, \"h\": 2, \"pixels\": {\"4294967296,0\": [1,2,3]}}}"));
    SpriteStore store(path);
    ASSERT_TRUE(store.load());
    const Sprite* wide = store.get("wide");
    ASSERT_NE(wide, nullptr);
    EXPECT_EQ(wide->w, 1000000);
    EXPECT_EQ(wide->h, -1000000);
    const Sprite* bright = store.get("bright");
    ASSERT_NE(bright, nullptr);
    Color c;
    ASSERT_TRUE(bright->get(0, 0, c));
    EXPECT_EQ(c, Color(255, 0, 5));
    EXPECT_EQ(store.get("far"), nullptr);
}

TEST(SpriteStore, MissingFile) {
    SpriteStore store(temp_file("does_not_exist.json"));
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.size(), 0u);
}

TEST(SpriteStore, DrawSpriteOffsets) {
    LEDGrid grid;
    Sprite s;
    s.w = 2; s.h = 2;
    s.set(1, 1, colors::Green);
    draw_sprite(grid, s, 5, 6);
    EXPECT_EQ(grid.get_pixel(6, 7), colors::Green);
    EXPECT_TRUE(grid.get_pixel(5, 6).is_black());
}

TEST(FontStore, SaveLoadGlyph) {
    const std::string path = temp_file("font_overrides.json");
    Glyph g = font::blank();
    g[0][1] = 1;
    g[4][2] = 1;
    {
        FontStore store(path);
        store.set_glyph('a', g);
        ASSERT_TRUE(store.save());
    }
    FontStore loaded(path);
    ASSERT_TRUE(loaded.load());
    Glyph out;
    ASSERT_TRUE(loaded.get_glyph('A', out));
    EXPECT_EQ(out, g);
    EXPECT_FALSE(loaded.get_glyph('B', out));
}

TEST(FontStore, CoercesValuesToBits) {
    FontStore store(temp_file("coerce.json"));
    Glyph g = font::blank();
    g[2][0] = 7;
    store.set_glyph('Z', g);
    Glyph out;
    ASSERT_TRUE(store.get_glyph('z', out));
    EXPECT_EQ(out[2][0], 1);
}

TEST(FontStore, HugeValuesCountAsLit) {
    const std::string path = temp_file("font_huge.json");
    ASSERT_TRUE(storage::write_file(path,
        "{\"Q\": [[1e300,0,0],[0,-1e300,0],[0,0,0.5],[0,0,0],[0,0,0]]}"));
    FontStore store(path);
    ASSERT_TRUE(store.load());
    Glyph out;
    ASSERT_TRUE(store.get_glyph('Q', out));
    EXPECT_EQ(out[0][0], 1);
    EXPECT_EQ(out[1][1], 1);
    EXPECT_EQ(out[2][2], 1);
    EXPECT_EQ(out[0][1], 0);
}

TEST(FontStore, ClearGlyphAndMalformedShape) {
    const std::string path = temp_file("font_shape.json");
    ASSERT_TRUE(storage::write_file(path,
        "{\"A\": [[0,1,0],[1,0,1],[1,1,1],[1,0,1],[1,0,1]], \"B\": [[1,1]]}"));
    FontStore store(path);
    ASSERT_TRUE(store.load());
    EXPECT_EQ(store.get_overrides().size(), 1u);
    store.clear_glyph('a');
    EXPECT_TRUE(store.get_overrides().empty());
}

TEST(FontStore, MalformedFile) {
    const std::string path = temp_file("font_bad.json");
    ASSERT_TRUE(storage::write_file(path, "[1,2"));
    FontStore store(path);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.get_overrides().empty());
}

TEST(Storage, WriteReadCreatesDirectories) {
    const std::string path = ::testing::TempDir() + "gridarcade_nested/a/b/file.txt";
    ASSERT_TRUE(storage::write_file(path, "hello"));
    std::string text;
    ASSERT_TRUE(storage::read_file(path, text));
    EXPECT_EQ(text, "hello");
}

TEST(Options, ParsesAndClampsValues) {
    options::Settings s;
    EXPECT_TRUE(options::apply_setting(s, "led_size", "999"));
    EXPECT_EQ(s.ledSize, layout::LED_SIZE_MAX);
    EXPECT_TRUE(options::apply_setting(s, "style", "square"));
    EXPECT_FALSE(s.circular);
    EXPECT_TRUE(options::apply_setting(s, "screen", "bottom"));
    EXPECT_FALSE(s.gridOnTop);
    EXPECT_TRUE(options::apply_setting(s, "carousel", "instant"));
    EXPECT_FALSE(s.smoothCarousel);
    EXPECT_FALSE(options::apply_setting(s, "volume", "3"));
}

TEST(Options, SaveLoadRoundTripAndGridSync) {
    const std::string path = temp_file("options.cfg");
    options::Settings saved = options::current();
    options::current().ledSize = 7;
    options::current().ledGap = 3;
    options::current().circular = false;
    ASSERT_TRUE(options::save_settings(path));
    options::current() = options::Settings();
    ASSERT_TRUE(options::load_settings(path));
    EXPECT_EQ(options::current().ledSize, 7);
    EXPECT_EQ(options::current().ledGap, 3);

    LEDGrid grid;
    options::apply_to(grid);
    EXPECT_EQ(grid.led_size(), 7);
    EXPECT_FALSE(grid.circular());
    grid.adjust_led_size(1);
    options::capture_from(grid);
    EXPECT_EQ(options::current().ledSize, 8);
    options::current() = saved;
    sound::set_enabled(saved.sound);
}

TEST(Options, StepperLimitsAndStylePick) {
    options::Settings saved = options::current();
    LEDGrid grid;
    grid.set_display(layout::LED_SIZE_MAX, 2, 1, true);
    options::begin(grid);
    const std::vector<UIButton> &b = options::screen_buttons();
    ASSERT_EQ(b.size(), 8u);
    EXPECT_TRUE(b[0].enabled);
    EXPECT_FALSE(b[1].enabled);
    EXPECT_FALSE(b[7].highlighted);
    EXPECT_EQ(ui_hit_button(b.data(), (int)b.size(), b[1].x + 2, b[1].y + 2), -1);

    InputState in;
    in.touching = in.touchPressed = true;
    in.stylusX = b[0].x + 2; in.stylusY = b[0].y + 2;
    EXPECT_EQ(options::update(in, grid), options::Action::None);
    EXPECT_EQ(grid.led_size(), layout::LED_SIZE_MAX - 1);
    EXPECT_TRUE(b[1].enabled);
    EXPECT_TRUE(b[7].highlighted);

    // Open LED STYLE, then pick its second item
    in.stylusX = 160; in.stylusY = 110;
    options::update(in, grid);
    in.stylusY = 140;
    options::update(in, grid);
    EXPECT_FALSE(grid.circular());
    ASSERT_FALSE(hw_log_lines().empty());
    EXPECT_EQ(hw_log_lines().back(), "options: style Square");

    options::current() = saved;
    sound::set_enabled(saved.sound);
}

TEST(Sound, BeepLengthAndAmplitude) {
    std::vector<int16_t> pcm = sound::synth_beep(440, 100, 1.0f);
    EXPECT_EQ(pcm.size(), 2205u);
    EXPECT_EQ(pcm[0], 0);
    int peak = 0;
    for (int16_t v : pcm) peak = std::max(peak, (int)v);
    EXPECT_GT(peak, 32000);
    EXPECT_TRUE(sound::synth_beep(440, 0).empty());
}

TEST(Sound, DisabledOffDeviceIsSilentNoop) {
    sound::set_enabled(true);
    EXPECT_FALSE(sound::is_available());
    sound::play_beep(880, 60);
    sound::play_melody({440, 880}, 50);
    EXPECT_TRUE(sound::toggle_enabled() == false);
    sound::set_enabled(true);
}
