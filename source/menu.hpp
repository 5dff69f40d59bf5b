// menu.hpp - horizontal carousel of game cards
#pragma once
#include <string>
#include "game.hpp"

class SpriteStore;

// What the menu asks the console to open once it stops running.
enum class MenuAction { None, Play, EditCard, EditLogo, EditFont, Options };

class CarouselMenu : public Game {
public:
    static constexpr int kNumGames = 8;

    CarouselMenu(LEDGrid &grid, const SpriteStore *sprites);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "LR Navigate  A Select  Y Smooth  X Card  B Logo  SELECT Font"; }

    // Draw one card shifted by (index - offset) card widths. withOverlay applies menu_card_<NAME>.
    void render_card(int index, float offset, bool withOverlay = true);
    void render_logo(int index, int x, int y);

    // Re-arm after the console returns from a game, keeping the current card.
    void resume();
    // Used by the console's touch buttons.
    void request(MenuAction a);

    static const char* game_name(int index);

    int selected_index = 0;
    int target_index = 0;
    float current_offset = 0.0f;
    bool smooth_transition = true;
    float title_pulse = 0.0f;
    MenuAction action = MenuAction::None;

private:
    void move_selection(int direction);
    void render_preview(int index, int position);

    const SpriteStore *sprites_;
};
