// overlay_editor.cpp - sprite painting with cursor, palette and touch
#include <algorithm>
#include "overlay_editor.hpp"
#include "led_grid.hpp"
#include "sprite_store.hpp"
#include "sound.hpp"

namespace editor_palette {
    const std::array<Color, kSize> &colors() {
        static const std::array<Color, kSize> palette = {{
            Color(255, 255, 255), Color(0, 0, 0), Color(255, 0, 0), Color(0, 255, 0),
            Color(0, 180, 255), Color(255, 220, 80), Color(255, 120, 180), Color(80, 80, 80),
        }};
        return palette;
    }
}

// Shared cursor moves for both editors.
static void move_cursor(const InputState &in, int w, int h, int &cx, int &cy) {
    if (in.leftPressed) cx = std::max(0, cx - 1);
    else if (in.rightPressed) cx = std::min(w - 1, cx + 1);
    else if (in.upPressed) cy = std::max(0, cy - 1);
    else if (in.downPressed) cy = std::min(h - 1, cy + 1);
}

// OverlayEditor -------------------------------------------------------------------

OverlayEditor::OverlayEditor(LEDGrid &grid, SpriteStore &store, int gameIndex) : Game(grid), store_(store) {
    targets.push_back({std::string("menu_logo_") + CarouselMenu::game_name(gameIndex), 11, 8});
    targets.push_back({"hud_race_dist", 3, 5});
    targets.push_back({"hud_race_score", 3, 5});
    select_target(0);
}

void OverlayEditor::select_target(int index) {
    target_index = ((index % (int)targets.size()) + (int)targets.size()) % (int)targets.size();
    const Target &t = target();
    sprite_ = &store_.get_or_create(t.name, t.w, t.h);
    cursor_x = std::min(cursor_x, t.w - 1);
    cursor_y = std::min(cursor_y, t.h - 1);
}

bool OverlayEditor::sprite_cell_at(int gx, int gy, int &sx, int &sy) const {
    sx = gx - 1;
    sy = gy - 1;
    return sx >= 0 && sy >= 0 && sx < target().w && sy < target().h;
}

void OverlayEditor::paint() {
    sprite_->set(cursor_x, cursor_y, editor_palette::colors()[(size_t)palette_index]);
}

void OverlayEditor::erase() {
    sprite_->erase(cursor_x, cursor_y);
}

void OverlayEditor::render() {
    const int w = target().w, h = target().h;
    grid_.clear();

    const Color frame{40, 40, 40};
    for (int x = 0; x < w + 2; ++x) {
        grid_.set_pixel(x, 0, frame);
        grid_.set_pixel(x, h + 1, frame);
    }
    for (int y = 0; y < h + 2; ++y) {
        grid_.set_pixel(0, y, frame);
        grid_.set_pixel(w + 1, y, frame);
    }

    draw_sprite(grid_, *sprite_, 1, 1);
    grid_.set_pixel(1 + cursor_x, 1 + cursor_y, Color(255, 255, 0));

    const Color label{180, 180, 180};
    grid_.render_text("ED", w + 3, 0, label);
    grid_.render_text("C", w + 3, 6, label);
    grid_.render_text("S", w + 3, 12, label);
    grid_.set_pixel(w + 4, h, editor_palette::colors()[(size_t)palette_index]);
}

void OverlayEditor::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }

    if (in.touching) {
        int gx, gy, sx, sy;
        if (grid_.screen_to_grid(in.stylusX, in.stylusY, gx, gy) && sprite_cell_at(gx, gy, sx, sy)) {
            cursor_x = sx;
            cursor_y = sy;
            if (in.bHeld) erase();
            else paint();
            if (in.touchPressed) sound::play_beep(in.bHeld ? 320 : 660, 15);
        }
        return;
    }

    move_cursor(in, target().w, target().h, cursor_x, cursor_y);
    if (in.xPressed) {
        palette_index = (palette_index + 1) % editor_palette::kSize;
        sound::play_beep(520, 20);
    } else if (in.aPressed) {
        paint();
        sound::play_beep(660, 20);
    } else if (in.bPressed) {
        erase();
        sound::play_beep(320, 20);
    } else if (in.yPressed) {
        select_target(target_index + 1);
        sound::play_beep(520, 20);
    } else if (in.startPressed) {
        store_.save();
        sound::play_beep(880, 40);
    }
}

// MenuCardEditor ------------------------------------------------------------------

MenuCardEditor::MenuCardEditor(LEDGrid &grid, SpriteStore &store, int gameIndex)
    : Game(grid), game_index(gameIndex), store_(store), preview_(grid, &store),
      name_(std::string("menu_card_") + CarouselMenu::game_name(gameIndex)) {
    sprite_ = &store_.get_or_create(name_, kW, kH);
}

void MenuCardEditor::bake_from_base() {
    grid_.clear();
    preview_.render_card(game_index, (float)game_index, false);
    for (int y = 0; y < kH; ++y)
        for (int x = 0; x < kW; ++x) {
            Color c = grid_.get_pixel(x, y + kTop);
            if (c.is_black()) sprite_->erase(x, y);
            else sprite_->set(x, y, c);
        }
}

void MenuCardEditor::paint() {
    sprite_->set(cursor_x, cursor_y, editor_palette::colors()[(size_t)palette_index]);
}

void MenuCardEditor::erase() {
    sprite_->erase(cursor_x, cursor_y);
}

void MenuCardEditor::render() {
    grid_.clear();
    preview_.render_card(game_index, (float)game_index, false);
    draw_sprite(grid_, *sprite_, 0, kTop);

    const auto &palette = editor_palette::colors();
    for (int i = 0; i < editor_palette::kSize; ++i) {
        grid_.set_pixel(i, 0, palette[(size_t)i]);
        grid_.set_pixel(i, 1, i == palette_index ? Color(255, 255, 0) : Color(20, 20, 20));
    }
    grid_.set_pixel(cursor_x, cursor_y + kTop, Color(255, 255, 0));
}

void MenuCardEditor::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }

    if (in.touching) {
        int gx, gy;
        if (!grid_.screen_to_grid(in.stylusX, in.stylusY, gx, gy)) return;
        if (gy == 0) {
            if (in.touchPressed && gx < editor_palette::kSize) {
                palette_index = gx;
                sound::play_beep(520, 20);
            }
            return;
        }
        if (gy < kTop) return;
        cursor_x = gx;
        cursor_y = gy - kTop;
        if (in.bHeld) erase();
        else paint();
        if (in.touchPressed) sound::play_beep(in.bHeld ? 320 : 660, 15);
        return;
    }

    move_cursor(in, kW, kH, cursor_x, cursor_y);
    if (in.xPressed) {
        palette_index = (palette_index + 1) % editor_palette::kSize;
        sound::play_beep(520, 20);
    } else if (in.aPressed) {
        paint();
        sound::play_beep(660, 20);
    } else if (in.bPressed) {
        erase();
        sound::play_beep(320, 20);
    } else if (in.yPressed) {
        bake_from_base();
        sound::play_beep(740, 60);
    } else if (in.startPressed) {
        store_.save();
        sound::play_beep(880, 40);
    }
}
