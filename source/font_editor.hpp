// font_editor.hpp - on-grid editor for the 3x5 font overrides
#pragma once
#include <string>
#include "game.hpp"
#include "font.hpp"

class FontStore;

class FontEditor : public Game {
public:
    enum class Mode { Atlas, Edit };

    FontEditor(LEDGrid &grid, FontStore &store, char initial = 'A');

    void update(float) override {}
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override;

    static const std::string &charset();
    static constexpr int kAtlasCols = 4;
    static constexpr int kAtlasRows = 3;
    static constexpr int kCellW = 4;    // glyph + gutter
    static constexpr int kCellH = 6;
    static constexpr int kZoom = 3;     // edit view magnification at (1,1)

    char current_char() const { return charset()[(size_t)char_index]; }
    // Select ch (case-insensitive) and open it in the edit view. Unknown characters are ignored.
    bool jump_to(char ch);
    void select_index(int index);
    // Atlas cell under grid (gx,gy); false in the gutter or past the charset.
    bool atlas_char_at(int gx, int gy, char &out) const;
    // Glyph cell under grid (gx,gy) in the edit view.
    bool glyph_cell_at(int gx, int gy, int &cx, int &cy) const;
    // Overrides with the unsaved glyph applied.
    FontOverrides preview_overrides() const;

    void save_glyph();
    void reset_glyph();
    void toggle_cell(int x, int y);
    int page_count() const;

    Mode mode = Mode::Atlas;
    int char_index = 0;
    int atlas_page = 0;
    int cursor_x = 0, cursor_y = 0;
    Glyph glyph{};

private:
    void load_glyph();
    void render_atlas();
    void render_editor();
    void handle_atlas(const InputState &in);
    void handle_edit(const InputState &in);

    FontStore &store_;
};
