// overlay_editor.hpp - pixel editors for stored sprites (menu logos, HUD icons, card overlays)
#pragma once
#include <array>
#include <string>
#include <vector>
#include "game.hpp"
#include "menu.hpp"

class SpriteStore;
struct Sprite;

namespace editor_palette {
    static constexpr int kSize = 8;
    const std::array<Color, kSize> &colors();
}

// Edits one named sprite drawn at (1,1). Y cycles through the editable targets.
class OverlayEditor : public Game {
public:
    struct Target {
        std::string name;
        int w, h;
    };

    // Targets: menu_logo_<NAME> for gameIndex, then the race HUD icons.
    OverlayEditor(LEDGrid &grid, SpriteStore &store, int gameIndex);

    void update(float) override {}
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "DPAD Move  A Paint  B Erase  X Color  Y Target  START Save"; }

    void select_target(int index);
    const Target &target() const { return targets[(size_t)target_index]; }
    Sprite &sprite() { return *sprite_; }
    void paint();
    void erase();
    // Grid cell to sprite cell; false outside the sprite.
    bool sprite_cell_at(int gx, int gy, int &sx, int &sy) const;

    std::vector<Target> targets;
    int target_index = 0;
    int cursor_x = 0, cursor_y = 0;
    int palette_index = 0;

private:
    SpriteStore &store_;
    Sprite *sprite_ = nullptr;
};

// Edits menu_card_<NAME>, a 19x17 overlay drawn at (0,2) over the live card.
class MenuCardEditor : public Game {
public:
    static constexpr int kW = 19;
    static constexpr int kH = 17;
    static constexpr int kTop = 2;

    MenuCardEditor(LEDGrid &grid, SpriteStore &store, int gameIndex);

    void update(float) override {}
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "DPAD Move  A Paint  B Erase  X Color  Y Bake  START Save"; }

    // Copy the card as drawn without its overlay into the overlay.
    void bake_from_base();
    Sprite &sprite() { return *sprite_; }
    const std::string &sprite_name() const { return name_; }

    int game_index;
    int cursor_x = 0, cursor_y = 0;
    int palette_index = 0;

private:
    void paint();
    void erase();

    SpriteStore &store_;
    CarouselMenu preview_;
    std::string name_;
    Sprite *sprite_ = nullptr;
};
