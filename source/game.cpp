// game.cpp - console loop: boot, carousel, games, editors and options
#include <cstdio>
#include <memory>
#include <string>
#include "hardware.hpp"
#include "game.hpp"
#include "led_grid.hpp"
#include "layout.hpp"
#include "sound.hpp"
#include "storage.hpp"
#include "sprite_store.hpp"
#include "font_store.hpp"
#include "options.hpp"
#include "ui_button.hpp"
#include "boot_screen.hpp"
#include "menu.hpp"
#include "pong.hpp"
#include "snake.hpp"
#include "flappy.hpp"
#include "basketball.hpp"
#include "pet_game.hpp"
#include "vacation.hpp"
#include "shadow_fight.hpp"
#include "asphalt_race.hpp"
#include "font_editor.hpp"
#include "overlay_editor.hpp"

namespace game
{
    // Menu touch buttons (bottom screen, grid on top)
    enum class TitleAction { Play, Options, Card, Logo, Font, Exit };
    struct TitleBtn { UIButton btn; TitleAction action; };
    static constexpr int kNumTitleButtons = 6;

    struct State
    {
        LEDGrid grid;
        GameManager manager{grid};
        SpriteStore sprites{storage::data_path("sprites.json")};
        FontStore fonts{storage::data_path("font_overrides.json")};
        std::unique_ptr<BootScreen> boot;
        std::unique_ptr<CarouselMenu> menu;
        TitleBtn titleButtons[kNumTitleButtons];
        int pressedBtn = -1;        // title button under the stylus since touchPressed
        bool prevTouching = false;
        bool exitRequested = false;
    };
    static std::unique_ptr<State> G;

    static void init_title_buttons()
    {
        static const struct { const char* label; TitleAction action; uint32_t color; } kDefs[kNumTitleButtons] = {
            {"PLAY",    TitleAction::Play,    ui_rgba(50,50,70)},
            {"OPTIONS", TitleAction::Options, ui_rgba(50,50,70)},
            {"CARD",    TitleAction::Card,    ui_rgba(40,60,50)},
            {"LOGO",    TitleAction::Logo,    ui_rgba(40,60,50)},
            {"FONT",    TitleAction::Font,    ui_rgba(40,60,50)},
            {"EXIT",    TitleAction::Exit,    ui_rgba(60,40,40)},
        };
        // Two columns of three, sized for the 320x240 bottom screen
        for (int i = 0; i < kNumTitleButtons; ++i) {
            TitleBtn &tb = G->titleButtons[i];
            tb.btn = {};
            tb.btn.x = (i % 2 == 0) ? 30 : 170;
            tb.btn.y = 60 + (i / 2) * 50;
            tb.btn.w = 120;
            tb.btn.h = 28;
            tb.btn.label = kDefs[i].label;
            tb.btn.color = kDefs[i].color;
            tb.action = kDefs[i].action;
        }
    }

    static bool grid_on_top()
    {
        switch (G->manager.state()) {
            case GameState::Editor: return false;
            case GameState::Options: return true;
            default: return options::current().gridOnTop;
        }
    }

    static void sync_window()
    {
        int w = grid_on_top() ? layout::TOP_SCREEN_W : layout::BOTTOM_SCREEN_W;
        int h = grid_on_top() ? layout::TOP_SCREEN_H : layout::BOTTOM_SCREEN_H;
        if (G->grid.window_width() != w || G->grid.window_height() != h) G->grid.update_window_size(w, h);
    }

    static std::unique_ptr<Game> make_game(int index)
    {
        LEDGrid &grid = G->grid;
        switch (index) {
            case 0: return std::unique_ptr<Game>(new Pong(grid));
            case 1: return std::unique_ptr<Game>(new Snake(grid));
            case 2: return std::unique_ptr<Game>(new Flappy(grid));
            case 3: return std::unique_ptr<Game>(new Basketball(grid));
            case 4: return std::unique_ptr<Game>(new PetGame(grid));
            case 5: return std::unique_ptr<Game>(new VacationGallery(grid));
            case 6: return std::unique_ptr<Game>(new ShadowFight(grid));
            case 7: return std::unique_ptr<Game>(new AsphaltRace(grid, &G->sprites));
            default: return nullptr;
        }
    }

    static void enter_options()
    {
        options::current().smoothCarousel = G->menu->smooth_transition;
        options::begin(G->grid);
        G->manager.set_state(GameState::Options);
        hw_log("options\n");
    }

    static void back_to_menu()
    {
        G->grid.set_font_overrides(G->fonts.get_overrides());
        G->menu->resume();
        G->manager.return_to_menu();
        hw_log("menu\n");
    }

    // Act on what the carousel asked for once it stopped running.
    static void open_menu_action(MenuAction action)
    {
        const int idx = G->menu->selected_index;
        G->manager.selected_game_index = idx;
        char buf[64];
        switch (action) {
            case MenuAction::Play: {
                std::unique_ptr<Game> g = make_game(idx);
                if (!g) { G->menu->resume(); return; }
                G->manager.start_game(std::move(g));
                snprintf(buf, sizeof buf, "play %s\n", CarouselMenu::game_name(idx)); hw_log(buf);
                break;
            }
            case MenuAction::EditCard:
                G->manager.start_editor(std::unique_ptr<Game>(new MenuCardEditor(G->grid, G->sprites, idx)));
                hw_log("card editor\n");
                break;
            case MenuAction::EditLogo:
                G->manager.start_editor(std::unique_ptr<Game>(new OverlayEditor(G->grid, G->sprites, idx)));
                hw_log("overlay editor\n");
                break;
            case MenuAction::EditFont:
                G->manager.start_editor(std::unique_ptr<Game>(new FontEditor(G->grid, G->fonts)));
                hw_log("font editor\n");
                break;
            case MenuAction::Options:
                G->menu->resume();
                enter_options();
                break;
            case MenuAction::None:
                G->menu->resume();
                break;
        }
    }

    // Shoulder chords adjust the display and are never forwarded. Returns true when a chord fired;
    // holding L or R alone leaves the frame's input to the screen.
    static bool handle_global_input(const InputState &in)
    {
        if (in.startPressed && in.selectPressed) {
            G->exitRequested = true;
            hw_log("exit (START+SELECT)\n");
            return true;
        }
        if (!in.lHeld && !in.rHeld) return false;

        LEDGrid &grid = G->grid;
        options::Settings &s = options::current();
        bool fired = true;
        if (in.lHeld) {
            if (in.upPressed) grid.adjust_led_size(1);
            else if (in.downPressed) grid.adjust_led_size(-1);
            else if (in.leftPressed) grid.adjust_led_spacing(-1);
            else if (in.rightPressed) grid.adjust_led_spacing(1);
            else if (in.xPressed) grid.toggle_style();
            else if (in.yPressed) s.gridOnTop = !s.gridOnTop;
            else if (in.aPressed) {
                s.sound = sound::toggle_enabled();
                if (s.sound) sound::play_beep(880, 60);
            } else if (in.bPressed && G->manager.state() == GameState::Menu) {
                enter_options();
            } else fired = false;
        } else {
            if (in.leftPressed) grid.adjust_led_gap(-1);
            else if (in.rightPressed) grid.adjust_led_gap(1);
            else fired = false;
        }
        if (fired) options::capture_from(grid);
        return fired;
    }

    // Touch buttons trigger on release over the button they were pressed on.
    static void update_title_buttons(const InputState &in)
    {
        if (in.touchPressed) {
            G->pressedBtn = -1;
            for (int i = 0; i < kNumTitleButtons; ++i)
                if (G->titleButtons[i].btn.contains(in.stylusX, in.stylusY)) { G->pressedBtn = i; break; }
        }
        if (in.touching && G->pressedBtn >= 0 && !G->titleButtons[G->pressedBtn].btn.contains(in.stylusX, in.stylusY))
            G->pressedBtn = -1;
        if (G->prevTouching && !in.touching && G->pressedBtn >= 0) {
            TitleAction action = G->titleButtons[G->pressedBtn].action;
            G->pressedBtn = -1;
            sound::play_beep(520, 25);
            switch (action) {
                case TitleAction::Play: G->menu->request(MenuAction::Play); break;
                case TitleAction::Options: G->menu->request(MenuAction::Options); break;
                case TitleAction::Card: G->menu->request(MenuAction::EditCard); break;
                case TitleAction::Logo: G->menu->request(MenuAction::EditLogo); break;
                case TitleAction::Font: G->menu->request(MenuAction::EditFont); break;
                case TitleAction::Exit: G->exitRequested = true; hw_log("exit (button)\n"); break;
            }
        }
    }

    void init()
    {
        hw_log("game_init\n");
        G.reset(new State());
        if (!options::load_settings(options::default_path())) hw_log("options: defaults\n");
        options::apply_to(G->grid);
        sound::set_enabled(options::current().sound);
        G->sprites.load();
        G->fonts.load();
        G->grid.set_font_overrides(G->fonts.get_overrides());

        G->boot.reset(new BootScreen(G->grid));
        G->menu.reset(new CarouselMenu(G->grid, &G->sprites));
        G->menu->smooth_transition = options::current().smoothCarousel;
        G->manager.set_state(GameState::Boot);
        init_title_buttons();
        sync_window();
        char buf[80];
        snprintf(buf, sizeof buf, "sprites %d, glyph overrides %d\n", (int)G->sprites.size(), (int)G->fonts.get_overrides().size());
        hw_log(buf);
    }

    void update(const InputState &raw, float dt)
    {
        // Touches only reach the grid when it is on the touch screen
        InputState in = raw;
        const bool touchForGrid = !grid_on_top();
        if (!touchForGrid) { in.touching = false; in.touchPressed = false; }

        bool consumed = handle_global_input(raw);
        if (G->exitRequested) return;

        GameManager &m = G->manager;
        switch (m.state()) {
            case GameState::Boot:
                G->boot->update(dt);
                if (!G->boot->is_running()) { m.set_state(GameState::Menu); hw_log("menu\n"); break; }
                if (!consumed) G->boot->handle_input(in);
                break;
            case GameState::Menu:
                G->menu->update(dt);
                if (!consumed) {
                    if (!touchForGrid) update_title_buttons(raw);
                    if (G->menu->is_running()) G->menu->handle_input(in);
                }
                if (!G->menu->is_running()) open_menu_action(G->menu->action);
                break;
            case GameState::Playing:
            case GameState::Editor:
                m.update(dt);
                if (m.state() == GameState::Menu) { back_to_menu(); break; }
                if (!consumed) m.handle_input(in);
                if (m.current() && !m.current()->is_running()) { m.return_to_menu(); back_to_menu(); }
                break;
            case GameState::Options: {
                G->menu->update(dt);
                if (consumed) break;
                options::Action a = options::update(raw, G->grid);
                if (a != options::Action::None) {
                    G->menu->smooth_transition = options::current().smoothCarousel;
                    m.set_state(GameState::Menu);
                }
                break;
            }
        }
        G->prevTouching = raw.touching;
        sync_window();
    }

    void render()
    {
        switch (G->manager.state()) {
            case GameState::Boot: G->boot->render(); break;
            case GameState::Menu:
            case GameState::Options: G->menu->render(); break;
            case GameState::Playing:
            case GameState::Editor: G->manager.render(); break;
        }
    }

    const char* help_text()
    {
        switch (G->manager.state()) {
            case GameState::Boot: return G->boot->help();
            case GameState::Menu: return "LR Navigate  A Play  Y Smooth  X Card  B Logo  SELECT Font  L+B Options";
            case GameState::Options: return "Tap to change  SAVE keeps  SELECT Cancel";
            default: return G->manager.current() ? G->manager.current()->help() : "";
        }
    }
}

// Public facade
void game_init() { game::init(); }
void game_update(const InputState &in, float dt) { game::update(in, dt); }
void game_render() { game::render(); }
GameState game_state() { return game::G->manager.state(); }
bool exit_requested() { return game::G && game::G->exitRequested; }
const LEDGrid& game_grid() { return game::G->grid; }
bool game_grid_on_top() { return game::grid_on_top(); }
const char* game_help_text() { return game::help_text(); }

#ifdef PLATFORM_3DS
void game_render_title_buttons(const InputState &in) {
    using namespace game;
    if (G->manager.state() != GameState::Menu || !grid_on_top()) return;
    hw_draw_text(100, 20, "GRID ARCADE", 0xFFFFFFFF);
    for (int i = 0; i < kNumTitleButtons; ++i) {
        auto &tb = G->titleButtons[i];
        bool pressed = in.touching && tb.btn.contains(in.stylusX, in.stylusY);
        ui_draw_button(tb.btn, pressed);
    }
}
void game_render_options() {
    if (game::G->manager.state() == GameState::Options) options::render();
}
#endif
