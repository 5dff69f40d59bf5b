// font_editor.cpp - atlas paging, magnified glyph editing and live preview
#include <algorithm>
#include "font_editor.hpp"
#include "font_store.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int kPageSize = FontEditor::kAtlasCols * FontEditor::kAtlasRows;

FontEditor::FontEditor(LEDGrid &grid, FontStore &store, char initial) : Game(grid), store_(store) {
    size_t pos = charset().find(font::normalize(initial));
    select_index(pos == std::string::npos ? 0 : (int)pos);
}

const std::string &FontEditor::charset() {
    static const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 -";
    return chars;
}

const char* FontEditor::help() const {
    if (mode == Mode::Atlas) return "DPAD Pick  A Edit  X/B Page  Y Type  SELECT Exit";
    return "DPAD Move  A Toggle  B Clear  START Save  Y Reset  X Atlas";
}

int FontEditor::page_count() const {
    return std::max(1, ((int)charset().size() + kPageSize - 1) / kPageSize);
}

void FontEditor::select_index(int index) {
    char_index = std::max(0, std::min((int)charset().size() - 1, index));
    atlas_page = char_index / kPageSize;
    load_glyph();
}

bool FontEditor::jump_to(char ch) {
    size_t pos = charset().find(font::normalize(ch));
    if (pos == std::string::npos) return false;
    select_index((int)pos);
    mode = Mode::Edit;
    sound::play_beep(520, 20);
    return true;
}

// Start from the override, then the built-in shape.
void FontEditor::load_glyph() {
    char ch = current_char();
    if (!store_.get_glyph(ch, glyph) && !font::builtin_glyph(ch, glyph)) glyph = font::blank();
    cursor_x = cursor_y = 0;
}

FontOverrides FontEditor::preview_overrides() const {
    FontOverrides o = store_.get_overrides();
    o[current_char()] = glyph;
    return o;
}

void FontEditor::save_glyph() {
    store_.set_glyph(current_char(), glyph);
    store_.save();
}

void FontEditor::reset_glyph() {
    store_.clear_glyph(current_char());
    store_.save();
    load_glyph();
}

void FontEditor::toggle_cell(int x, int y) {
    glyph[y][x] = glyph[y][x] ? 0 : 1;
}

bool FontEditor::atlas_char_at(int gx, int gy, char &out) const {
    if (gx < 0 || gy < 0) return false;
    int col = gx / kCellW, row = gy / kCellH;
    if (col >= kAtlasCols || row >= kAtlasRows) return false;
    if (gx % kCellW >= font::GLYPH_W || gy % kCellH >= font::GLYPH_H) return false;
    int idx = atlas_page * kPageSize + row * kAtlasCols + col;
    if (idx >= (int)charset().size()) return false;
    out = charset()[(size_t)idx];
    return true;
}

bool FontEditor::glyph_cell_at(int gx, int gy, int &cx, int &cy) const {
    int x = gx - 1, y = gy - 1;
    if (x < 0 || y < 0 || x >= font::GLYPH_W * kZoom || y >= font::GLYPH_H * kZoom) return false;
    cx = x / kZoom;
    cy = y / kZoom;
    return true;
}

void FontEditor::render() {
    grid_.clear();
    grid_.set_font_overrides(preview_overrides());
    if (mode == Mode::Atlas) render_atlas();
    else render_editor();
}

void FontEditor::render_atlas() {
    const Color border{40, 40, 40};
    const int start = atlas_page * kPageSize;
    for (int i = 0; i < kPageSize && start + i < (int)charset().size(); ++i) {
        int bx = (i % kAtlasCols) * kCellW;
        int by = (i / kAtlasCols) * kCellH;
        for (int dx = 0; dx < 3; ++dx) grid_.set_pixel(bx + dx, by + 5, border);
        for (int dy = 0; dy < 5; ++dy) grid_.set_pixel(bx + 3, by + dy, border);

        char c = charset()[(size_t)(start + i)];
        Color col = (start + i == char_index) ? Color(255, 255, 0) : Color(120, 200, 255);
        grid_.render_text(std::string(1, c), bx, by, col);
    }
    grid_.render_number(atlas_page + 1, 17, 0, Color(120, 120, 120));
}

void FontEditor::render_editor() {
    const Color frame{40, 40, 40};
    grid_.fill_rect(0, 0, 11, 17, colors::Black);
    for (int x = 0; x < 11; ++x) {
        grid_.set_pixel(x, 0, frame);
        grid_.set_pixel(x, 16, frame);
    }
    for (int y = 0; y < 17; ++y) {
        grid_.set_pixel(0, y, frame);
        grid_.set_pixel(10, y, frame);
    }

    for (int y = 0; y < font::GLYPH_H; ++y)
        for (int x = 0; x < font::GLYPH_W; ++x)
            if (glyph[y][x]) grid_.fill_rect(1 + x * kZoom, 1 + y * kZoom, kZoom, kZoom, Color(0, 255, 255));

    // cursor box
    const Color cursor{255, 255, 0};
    int cx0 = 1 + cursor_x * kZoom, cy0 = 1 + cursor_y * kZoom;
    for (int d = 0; d < kZoom; ++d) {
        grid_.set_pixel(cx0 + d, cy0, cursor);
        grid_.set_pixel(cx0 + d, cy0 + kZoom - 1, cursor);
        grid_.set_pixel(cx0, cy0 + d, cursor);
        grid_.set_pixel(cx0 + kZoom - 1, cy0 + d, cursor);
    }

    grid_.render_text("CH", 12, 0, Color(140, 140, 140));
    grid_.render_text(std::string(1, current_char()), 16, 0, colors::White);
    grid_.render_text("S", 12, 6, Color(120, 120, 120));
    grid_.render_text("R", 16, 6, Color(120, 120, 120));
    grid_.render_text("GAMES", 0, 18 - 5, Color(0, 255, 255));
}

void FontEditor::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (mode == Mode::Atlas) handle_atlas(in);
    else handle_edit(in);
}

void FontEditor::handle_atlas(const InputState &in) {
    if (in.touchPressed) {
        int gx, gy;
        char c;
        if (grid_.screen_to_grid(in.stylusX, in.stylusY, gx, gy) && atlas_char_at(gx, gy, c)) {
            select_index((int)charset().find(c));
            mode = Mode::Edit;
            sound::play_beep(740, 20);
        }
        return;
    }

    int move = 0;
    if (in.leftPressed) move = -1;
    else if (in.rightPressed) move = 1;
    else if (in.upPressed) move = -kAtlasCols;
    else if (in.downPressed) move = kAtlasCols;
    if (move) {
        select_index(char_index + move);
        sound::play_beep(420, 15);
        return;
    }

    if (in.xPressed || in.bPressed) {
        int pages = page_count();
        atlas_page = in.xPressed ? (atlas_page + 1) % pages : (atlas_page + pages - 1) % pages;
        select_index(atlas_page * kPageSize);
        sound::play_beep(in.xPressed ? 520 : 420, 25);
    } else if (in.aPressed) {
        mode = Mode::Edit;
        sound::play_beep(740, 20);
    } else if (in.yPressed) {
#ifdef PLATFORM_3DS
        char typed;
        if (hw_prompt_char("Jump to character", typed)) jump_to(typed);
#endif
    }
}

void FontEditor::handle_edit(const InputState &in) {
    if (in.touchPressed) {
        int gx, gy, cx, cy;
        if (grid_.screen_to_grid(in.stylusX, in.stylusY, gx, gy) && glyph_cell_at(gx, gy, cx, cy)) {
            cursor_x = cx;
            cursor_y = cy;
            toggle_cell(cx, cy);
            sound::play_beep(660, 15);
        }
        return;
    }

    if (in.leftPressed) cursor_x = std::max(0, cursor_x - 1);
    else if (in.rightPressed) cursor_x = std::min(font::GLYPH_W - 1, cursor_x + 1);
    else if (in.upPressed) cursor_y = std::max(0, cursor_y - 1);
    else if (in.downPressed) cursor_y = std::min(font::GLYPH_H - 1, cursor_y + 1);
    else if (in.aPressed) {
        toggle_cell(cursor_x, cursor_y);
        sound::play_beep(660, 15);
    } else if (in.bPressed) {
        glyph[cursor_y][cursor_x] = 0;
        sound::play_beep(320, 15);
    } else if (in.startPressed) {
        save_glyph();
        sound::play_beep(880, 40);
    } else if (in.yPressed) {
        reset_glyph();
        sound::play_beep(320, 40);
    } else if (in.xPressed) {
        mode = Mode::Atlas;
        sound::play_beep(520, 20);
    }
}
