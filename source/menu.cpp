// menu.cpp - carousel menu: cards, built-in logos and navigation
#include <algorithm>
#include <cmath>
#include <cstring>
#include "menu.hpp"
#include "led_grid.hpp"
#include "sprite_store.hpp"
#include "sound.hpp"
#include "text_layout.hpp"

namespace {
    static const char* kGameNames[CarouselMenu::kNumGames] = {
        "PONG", "SNAKE", "FLAP", "BBALL", "PETS", "VACAY", "FIGHT", "RACE"
    };
    static constexpr float kScrollSpeed = 8.0f;

    void pong_logo(LEDGrid &g, int x, int y) {
        const Color white{255, 255, 255}, yellow{255, 255, 0};
        for (int i = 0; i < 5; ++i) {
            g.set_pixel(x, y + i + 1, white); g.set_pixel(x + 1, y + i + 1, white);
            g.set_pixel(x + 9, y + i + 1, white); g.set_pixel(x + 10, y + i + 1, white);
        }
        g.fill_rect(x + 5, y + 3, 2, 2, yellow);
    }

    void snake_logo(LEDGrid &g, int x, int y) {
        static const int pts[][2] = {
            {5,1},{6,1},{7,1},{4,2},{5,2},{4,3},{5,3},{6,3},{6,4},{7,4},{5,5},{6,5},{7,5}
        };
        int i = 0;
        for (const auto &p : pts) g.set_pixel(x + p[0], y + p[1], (i++ % 2 == 0) ? Color(0, 255, 0) : Color(150, 255, 0));
    }

    void flappy_logo(LEDGrid &g, int x, int y) {
        for (int dy = 0; dy < 8; ++dy) {
            if (dy == 3 || dy == 4) continue;
            g.set_pixel(x + 8, y + dy, Color(0, 200, 80));
            g.set_pixel(x + 9, y + dy, Color(0, 150, 60));
        }
        g.set_pixel(x + 3, y + 3, Color(255, 230, 60));
        g.set_pixel(x + 3, y + 4, Color(255, 230, 60));
        g.set_pixel(x + 4, y + 3, Color(255, 180, 0));
        g.set_pixel(x + 4, y + 4, Color(255, 180, 0));
    }

    void basketball_logo(LEDGrid &g, int x, int y) {
        static const uint8_t ring[3][10] = {
            {0,0,1,1,1,1,1,1,0,0},
            {0,1,0,0,0,0,0,0,1,0},
            {1,0,0,0,0,0,0,0,0,1},
        };
        static const uint8_t flame[7][10] = {
            {0,0,0,0,1,1,0,0,0,0},
            {0,0,0,1,2,2,1,0,0,0},
            {0,0,1,2,2,2,2,1,0,0},
            {0,1,2,2,2,2,2,2,1,0},
            {0,1,2,2,2,2,2,2,1,0},
            {0,0,1,2,2,2,2,1,0,0},
            {0,0,0,1,2,2,1,0,0,0},
        };
        for (int dy = 0; dy < 3; ++dy)
            for (int dx = 0; dx < 10; ++dx)
                if (ring[dy][dx]) g.set_pixel(x + dx, y + dy, Color(20, 20, 20));
        for (int dy = 0; dy < 7; ++dy)
            for (int dx = 0; dx < 10; ++dx) {
                if (flame[dy][dx] == 1) g.set_pixel(x + dx, y + dy + 1, Color(150, 20, 35));
                else if (flame[dy][dx] == 2) g.set_pixel(x + dx, y + dy + 1, Color(200, 30, 45));
            }
    }

    void pet_logo(LEDGrid &g, int x, int y) {
        const Color pink{255, 120, 180}, dark{180, 60, 120};
        static const int toes[][2] = {{2,1},{4,0},{6,0},{8,1}};
        for (const auto &t : toes) {
            g.set_pixel(x + t[0], y + t[1], pink);
            g.set_pixel(x + t[0], y + t[1] + 1, dark);
        }
        static const int pad[][2] = {
            {4,3},{5,3},{6,3},
            {3,4},{4,4},{5,4},{6,4},{7,4},
            {3,5},{4,5},{5,5},{6,5},{7,5},
            {4,6},{5,6},{6,6},
        };
        int i = 0;
        for (const auto &p : pad) g.set_pixel(x + p[0], y + p[1], (i++ % 2 == 0) ? pink : dark);
    }

    void vacay_logo(LEDGrid &g, int x, int y) {
        const Color sun{255, 220, 80};
        for (int dx = 0; dx < 10; ++dx) {
            g.set_pixel(x + dx, y, Color(80, 160, 255));
            if (dx % 2 == 0) g.set_pixel(x + dx, y + 3, Color(120, 220, 255));
            g.set_pixel(x + dx, y + 4, Color(0, 120, 200));
            g.set_pixel(x + dx, y + 5, Color(200, 160, 80));
        }
        g.set_pixel(x + 7, y + 1, sun);
        g.set_pixel(x + 6, y + 1, sun);
        g.set_pixel(x + 7, y + 2, sun);
    }

    void fight_logo(LEDGrid &g, int x, int y) {
        const Color left{255, 255, 255}, right{30, 30, 30}, mid{255, 255, 0};
        g.set_pixel(x + 2, y + 2, left);
        g.set_pixel(x + 7, y + 2, right);
        g.set_pixel(x + 2, y + 4, left);
        g.set_pixel(x + 7, y + 4, right);
        g.set_pixel(x + 4, y + 3, mid);
        g.set_pixel(x + 5, y + 3, mid);
    }

    void race_logo(LEDGrid &g, int x, int y) {
        const Color road{80, 80, 80}, edge{220, 220, 220}, car{60, 200, 255}, carDark{20, 120, 200};
        for (int dy = 0; dy < 8; ++dy) {
            int hw = 1 + dy / 2;
            int cx = x + 5, cy = y + dy;
            for (int dx = -hw; dx <= hw; ++dx) g.set_pixel(cx + dx, cy, road);
            g.set_pixel(cx - hw, cy, edge);
            g.set_pixel(cx + hw, cy, edge);
        }
        g.set_pixel(x + 4, y + 6, car);
        g.set_pixel(x + 5, y + 6, carDark);
        g.set_pixel(x + 4, y + 7, carDark);
        g.set_pixel(x + 5, y + 7, car);
    }
}

CarouselMenu::CarouselMenu(LEDGrid &grid, const SpriteStore *sprites) : Game(grid), sprites_(sprites) {}

const char* CarouselMenu::game_name(int index) {
    if (index < 0 || index >= kNumGames) return "";
    return kGameNames[index];
}

void CarouselMenu::update(float dt) {
    title_pulse += dt;
    if (smooth_transition) {
        float diff = (float)target_index - current_offset;
        if (std::fabs(diff) > 0.01f) current_offset += diff * kScrollSpeed * dt;
        else current_offset = (float)target_index;
    }
}

void CarouselMenu::render() {
    using namespace text_layout;
    grid_.clear(Color(0, 0, 8));

    float pulse = (std::sin(title_pulse * 2.0f) + 1.0f) / 2.0f;
    Color title((int)(60 + 80 * pulse), (int)(180 + 40 * pulse), 255);
    grid_.render_text("GAMES", centered_x(TITLE, 5), TITLE.y, title);

    if (smooth_transition) {
        // Cards slide off-grid safely; set_pixel clips.
        for (int i = 0; i < kNumGames; ++i)
            if (std::fabs((float)i - current_offset) <= 1.25f) render_card(i, current_offset);
    } else {
        render_card(selected_index, (float)selected_index);
        if (selected_index > 0) render_preview(selected_index - 1, -1);
        if (selected_index < kNumGames - 1) render_preview(selected_index + 1, 1);
    }

    const Color arrow{130, 130, 130};
    if (selected_index > 0) draw_left_arrow(grid_, 1, 9, arrow);
    if (selected_index < kNumGames - 1) draw_right_arrow(grid_, 17, 9, arrow);

    const char* hint = "LR SEL";
    grid_.render_text(hint, centered_x(HINT, (int)std::strlen(hint)), HINT.y, Color(120, 120, 120));
}

void CarouselMenu::render_card(int index, float offset, bool withOverlay) {
    if (index < 0 || index >= kNumGames) return;
    const int size = LEDGrid::kSize;
    int xShift = (int)(((float)index - offset) * size);

    const Color border{30, 30, 40};
    for (int bx = 0; bx < size; ++bx) {
        grid_.set_pixel(xShift + bx, 4, border);
        grid_.set_pixel(xShift + bx, 18, border);
    }
    for (int by = 4; by < size; ++by) {
        grid_.set_pixel(xShift, by, border);
        grid_.set_pixel(xShift + 18, by, border);
    }

    grid_.render_number(index + 1, xShift + 8, 2, Color(255, 255, 0));
    render_logo(index, xShift + 4, 6);

    std::string name = kGameNames[index];
    int textX = xShift + (size - (int)name.size() * 4) / 2;
    grid_.render_text(name, textX, 15, Color(0, 255, 255));

    if (withOverlay && sprites_) {
        const Sprite* overlay = sprites_->get(std::string("menu_card_") + kGameNames[index]);
        if (overlay) draw_sprite(grid_, *overlay, xShift, 2);
    }
}

void CarouselMenu::render_preview(int index, int position) {
    int x = position < 0 ? 1 : 15;
    grid_.render_number(index + 1, x, LEDGrid::kSize / 2 - 2, Color(80, 80, 80));
}

void CarouselMenu::render_logo(int index, int x, int y) {
    if (sprites_) {
        const Sprite* custom = sprites_->get(std::string("menu_logo_") + game_name(index));
        if (custom) { draw_sprite(grid_, *custom, x, y); return; }
    }
    switch (index) {
        case 0: pong_logo(grid_, x, y); break;
        case 1: snake_logo(grid_, x, y); break;
        case 2: flappy_logo(grid_, x, y); break;
        case 3: basketball_logo(grid_, x, y); break;
        case 4: pet_logo(grid_, x, y); break;
        case 5: vacay_logo(grid_, x, y); break;
        case 6: fight_logo(grid_, x, y); break;
        case 7: race_logo(grid_, x, y); break;
        default: break;
    }
}

void CarouselMenu::move_selection(int direction) {
    selected_index = std::max(0, std::min(kNumGames - 1, selected_index + direction));
    target_index = selected_index;
    if (!smooth_transition) current_offset = (float)target_index;
}

void CarouselMenu::request(MenuAction a) {
    action = a;
    running_ = false;
}

void CarouselMenu::resume() {
    action = MenuAction::None;
    running_ = true;
}

void CarouselMenu::handle_input(const InputState &in) {
    if (in.leftPressed) { sound::play_beep(420, 35); move_selection(-1); }
    else if (in.rightPressed) { sound::play_beep(520, 35); move_selection(1); }
    else if (in.aPressed || in.startPressed) { sound::play_beep(740, 60); request(MenuAction::Play); }
    else if (in.yPressed) {
        smooth_transition = !smooth_transition;
        if (!smooth_transition) current_offset = (float)target_index;
        sound::play_beep(660, 40);
    }
    else if (in.xPressed) request(MenuAction::EditCard);
    else if (in.bPressed) request(MenuAction::EditLogo);
    else if (in.selectPressed) request(MenuAction::EditFont);
}
