// test_console.cpp - GameManager transitions and the console loop
#include <gtest/gtest.h>
#include <memory>
#include "game.hpp"
#include "led_grid.hpp"
#include "menu.hpp"
#include "options.hpp"
#include "snake.hpp"

namespace {
    struct Dummy : Game {
        explicit Dummy(LEDGrid &g) : Game(g) {}
        void update(float) override { ++updates; }
        void render() override { grid_.set_pixel(0, 0, colors::White); }
        void handle_input(const InputState &in) override { if (in.selectPressed) running_ = false; }
        int updates = 0;
    };

    InputState pressed_a() { InputState in; in.aPressed = true; return in; }
}

TEST(GameManager, ForwardsOnlyWhilePlaying) {
    LEDGrid grid;
    GameManager m(grid);
    EXPECT_EQ(m.state(), GameState::Boot);
    m.update(0.1f);
    m.render();
    EXPECT_TRUE(grid.get_pixel(0, 0).is_black());

    auto *d = new Dummy(grid);
    m.start_game(std::unique_ptr<Game>(d));
    EXPECT_EQ(m.state(), GameState::Playing);
    m.update(0.1f);
    EXPECT_EQ(d->updates, 1);
    m.render();
    EXPECT_EQ(grid.get_pixel(0, 0), colors::White);
}

TEST(GameManager, StoppedGameReturnsToMenu) {
    LEDGrid grid;
    GameManager m(grid);
    m.start_editor(std::unique_ptr<Game>(new Dummy(grid)));
    EXPECT_EQ(m.state(), GameState::Editor);
    InputState in;
    in.selectPressed = true;
    m.handle_input(in);
    m.update(0.1f);
    EXPECT_EQ(m.state(), GameState::Menu);
    EXPECT_EQ(m.current(), nullptr);
}

TEST(CarouselMenu, SelectionClampsAndRequestsPlay) {
    LEDGrid grid;
    CarouselMenu menu(grid, nullptr);
    InputState in;
    in.leftPressed = true;
    menu.handle_input(in);
    EXPECT_EQ(menu.selected_index, 0);
    in = InputState();
    in.rightPressed = true;
    for (int i = 0; i < 20; ++i) menu.handle_input(in);
    EXPECT_EQ(menu.selected_index, CarouselMenu::kNumGames - 1);
    EXPECT_STREQ(CarouselMenu::game_name(menu.selected_index), "RACE");
    menu.handle_input(pressed_a());
    EXPECT_FALSE(menu.is_running());
    EXPECT_EQ(menu.action, MenuAction::Play);
    menu.resume();
    EXPECT_TRUE(menu.is_running());
    EXPECT_EQ(menu.selected_index, CarouselMenu::kNumGames - 1);
}

TEST(CarouselMenu, SmoothScrollConverges) {
    LEDGrid grid;
    CarouselMenu menu(grid, nullptr);
    InputState in;
    in.rightPressed = true;
    menu.handle_input(in);
    for (int i = 0; i < 200; ++i) menu.update(1.0f / 60.0f);
    EXPECT_FLOAT_EQ(menu.current_offset, 1.0f);
    menu.render();
}

TEST(CarouselMenu, EditorShortcuts) {
    LEDGrid grid;
    CarouselMenu menu(grid, nullptr);
    InputState in;
    in.xPressed = true;
    menu.handle_input(in);
    EXPECT_EQ(menu.action, MenuAction::EditCard);
    menu.resume();
    in = InputState();
    in.selectPressed = true;
    menu.handle_input(in);
    EXPECT_EQ(menu.action, MenuAction::EditFont);
}

class ConsoleTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = options::current();
        game_init();
        options::current().gridOnTop = true;
    }
    void TearDown() override { options::current() = saved_; }

    void to_menu() {
        game_update(pressed_a(), 0.016f);
        game_update(InputState(), 0.016f);
        ASSERT_EQ(game_state(), GameState::Menu);
    }

    options::Settings saved_;
};

TEST_F(ConsoleTest, BootSkipsToMenu) {
    EXPECT_EQ(game_state(), GameState::Boot);
    to_menu();
}

TEST_F(ConsoleTest, PlayAndQuitGame) {
    to_menu();
    game_update(pressed_a(), 0.016f);
    EXPECT_EQ(game_state(), GameState::Playing);
    game_render();
    InputState sel;
    sel.selectPressed = true;
    game_update(sel, 0.016f);
    EXPECT_EQ(game_state(), GameState::Menu);
}

TEST_F(ConsoleTest, StartSelectQuits) {
    InputState in;
    in.startPressed = in.selectPressed = true;
    game_update(in, 0.016f);
    EXPECT_TRUE(exit_requested());
}

TEST_F(ConsoleTest, ShoulderChordsAdjustDisplay) {
    to_menu();
    int size = game_grid().led_size();
    InputState in;
    in.lHeld = true;
    in.downPressed = true;
    game_update(in, 0.016f);
    EXPECT_EQ(game_grid().led_size(), size - 1);
    EXPECT_EQ(options::current().ledSize, size - 1);

    in = InputState();
    in.lHeld = true;
    in.aPressed = true;
    game_update(in, 0.016f);
    // Chord is consumed, the menu did not start a game
    EXPECT_EQ(game_state(), GameState::Menu);

    in = InputState();
    in.lHeld = true;
    in.yPressed = true;
    game_update(in, 0.016f);
    EXPECT_FALSE(game_grid_on_top());
    EXPECT_EQ(game_grid().window_width(), layout::BOTTOM_SCREEN_W);
}

TEST_F(ConsoleTest, HeldShoulderWithoutChordPassesInput) {
    to_menu();
    const int gap = game_grid().led_gap();
    InputState in = pressed_a();
    in.rHeld = true;
    game_update(in, 0.016f);
    EXPECT_EQ(game_grid().led_gap(), gap);
    EXPECT_EQ(game_state(), GameState::Playing);

    // A held shoulder keeps the game getting its input
    in = InputState();
    in.lHeld = true;
    in.selectPressed = true;
    game_update(in, 0.016f);
    EXPECT_EQ(game_state(), GameState::Menu);
}

TEST_F(ConsoleTest, EditorsUseTouchScreen) {
    to_menu();
    InputState in;
    in.xPressed = true;
    game_update(in, 0.016f);
    EXPECT_EQ(game_state(), GameState::Editor);
    EXPECT_FALSE(game_grid_on_top());
    EXPECT_STRNE(game_help_text(), "");
}

TEST_F(ConsoleTest, TitleButtonTriggersOnRelease) {
    to_menu();
    InputState down;
    down.touching = down.touchPressed = true;
    down.stylusX = 40; down.stylusY = 70;
    game_update(down, 0.016f);
    EXPECT_EQ(game_state(), GameState::Menu);
    game_update(InputState(), 0.016f);
    EXPECT_EQ(game_state(), GameState::Playing);
}

TEST_F(ConsoleTest, OptionsChordAndCancel) {
    to_menu();
    InputState in;
    in.lHeld = true;
    in.bPressed = true;
    game_update(in, 0.016f);
    EXPECT_EQ(game_state(), GameState::Options);
    in = InputState();
    in.selectPressed = true;
    game_update(in, 0.016f);
    EXPECT_EQ(game_state(), GameState::Menu);
}
