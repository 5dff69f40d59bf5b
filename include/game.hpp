// game.hpp - screen base class, console state machine and the public game facade
#pragma once
#include <memory>
#include <random>
#include "hardware.hpp"
#include "color.hpp"

class LEDGrid;

// Base for every screen that draws on the LED grid (boot, menu, games, editors).
class Game {
public:
    explicit Game(LEDGrid &grid) : grid_(grid) {}
    virtual ~Game() = default;

    virtual void update(float dt) = 0;
    virtual void render() = 0;
    virtual void handle_input(const InputState &in) = 0;
    // One-line control help shown on the screen without the grid.
    virtual const char* help() const { return "SELECT Menu"; }

    bool is_running() const { return running_; }
    void exit() { running_ = false; }
    void seed(unsigned s) { rng_.seed(s); }

protected:
    float uniform(float lo, float hi) { return std::uniform_real_distribution<float>(lo, hi)(rng_); }
    int randint(int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng_); } // inclusive
    bool chance(float p) { return uniform(0.0f, 1.0f) < p; }

    LEDGrid &grid_;
    bool running_ = true;
    std::mt19937 rng_{std::random_device{}()};
};

enum class GameState { Boot, Menu, Playing, Editor, Options };

// Owns the active game or editor and forwards frames to it while Playing/Editor.
class GameManager {
public:
    explicit GameManager(LEDGrid &grid) : grid_(grid) {}

    void set_state(GameState s) { state_ = s; }
    GameState state() const { return state_; }
    void start_game(std::unique_ptr<Game> game);
    void start_editor(std::unique_ptr<Game> editor);
    void return_to_menu();

    void update(float dt);
    void render();
    void handle_input(const InputState &in);

    Game* current() { return current_.get(); }
    LEDGrid &grid() { return grid_; }
    int selected_game_index = 0;

private:
    bool forwarding() const { return current_ && (state_ == GameState::Playing || state_ == GameState::Editor); }

    LEDGrid &grid_;
    GameState state_ = GameState::Boot;
    std::unique_ptr<Game> current_;
};

// Small '<' and '>' chevrons centred on (x,y), shared by menu and gallery screens.
void draw_left_arrow(LEDGrid &grid, int x, int y, const Color &color);
void draw_right_arrow(LEDGrid &grid, int x, int y, const Color &color);

// Console facade ------------------------------------------------------------------
void game_init();
void game_update(const InputState &in, float dt);
// Draws the active screen into the LED grid.
void game_render();
GameState game_state();
bool exit_requested();
const LEDGrid& game_grid();
// True when the LED grid should be shown on the top screen (false: bottom/touch screen).
bool game_grid_on_top();
// Control hints for the active screen.
const char* game_help_text();
#ifdef PLATFORM_3DS
// Renders menu touch buttons (bottom screen). Pass current input for pressed highlight.
void game_render_title_buttons(const InputState &in);
// Options screen (bottom screen).
void game_render_options();
#endif
