// game_manager.cpp - state machine that owns the active game or editor
#include <utility>
#include "game.hpp"
#include "led_grid.hpp"

void GameManager::start_game(std::unique_ptr<Game> game) {
    current_ = std::move(game);
    state_ = GameState::Playing;
}

void GameManager::start_editor(std::unique_ptr<Game> editor) {
    current_ = std::move(editor);
    state_ = GameState::Editor;
}

void GameManager::return_to_menu() {
    current_.reset();
    state_ = GameState::Menu;
}

void GameManager::update(float dt) {
    if (!forwarding()) return;
    current_->update(dt);
    if (!current_->is_running()) return_to_menu();
}

void GameManager::render() {
    if (forwarding()) current_->render();
}

void GameManager::handle_input(const InputState &in) {
    if (forwarding()) current_->handle_input(in);
}

void draw_left_arrow(LEDGrid &grid, int x, int y, const Color &color) {
    static const int pts[5][2] = {{0,0},{1,-1},{1,1},{2,-2},{2,2}};
    for (const auto &p : pts) grid.set_pixel(x + p[0], y + p[1], color);
}

void draw_right_arrow(LEDGrid &grid, int x, int y, const Color &color) {
    static const int pts[5][2] = {{0,0},{-1,-1},{-1,1},{-2,-2},{-2,2}};
    for (const auto &p : pts) grid.set_pixel(x + p[0], y + p[1], color);
}
