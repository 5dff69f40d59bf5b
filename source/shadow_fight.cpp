// shadow_fight.cpp - jump physics, AI chase and punch exchange
#include <algorithm>
#include <cmath>
#include "shadow_fight.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;

ShadowFight::ShadowFight(LEDGrid &grid) : Game(grid) {
    reset();
}

void ShadowFight::reset() {
    game_over = false;
    winner.clear();
    p1 = Fighter{5.0f, (float)kGroundY};
    ai = Fighter{13.0f, (float)kGroundY};
}

void ShadowFight::update(float dt) {
    if (game_over) return;

    for (Fighter *f : {&p1, &ai}) {
        f->attack_cd = std::max(0.0f, f->attack_cd - dt);
        f->attack_timer = std::max(0.0f, f->attack_timer - dt);
        apply_physics(*f, dt);
    }

    update_ai(dt);
    resolve_hits();

    if (p1.hp <= 0) {
        game_over = true;
        winner = "AI";
        sound::play_beep(220, 200);
    } else if (ai.hp <= 0) {
        game_over = true;
        winner = "YOU";
        sound::play_beep(880, 120);
    }
}

void ShadowFight::apply_physics(Fighter &f, float dt) {
    f.vy += kGravity * dt;
    f.y += f.vy * dt;
    if (f.y >= kGroundY) {
        f.y = (float)kGroundY;
        f.vy = 0.0f;
    }
}

void ShadowFight::update_ai(float dt) {
    float dist = ai.x - p1.x;
    if (std::fabs(dist) > 2.5f) {
        ai.x += (dist > 0 ? -1.0f : 1.0f) * kAiChaseSpeed * dt;
    } else if (ai.attack_cd <= 0.0f) {
        ai.attack_timer = kPunchTime;
        ai.attack_cd = kAiCooldown;
        sound::play_beep(620, 25);
    }

    if (ai.y >= kGroundY && chance(0.01f)) ai.vy = kJumpV;
    ai.x = std::max(1.0f, std::min(N - 2.0f, ai.x));
}

bool ShadowFight::in_reach() const {
    return std::fabs(ai.x - p1.x) <= 2.0f && std::fabs(ai.y - p1.y) <= 2.5f;
}

void ShadowFight::resolve_hits() {
    if (p1.attack_timer > 0.0f && in_reach()) {
        ai.hp -= 1;
        p1.attack_timer = 0.0f;
        sound::play_beep(880, 20);
    }
    if (ai.attack_timer > 0.0f && in_reach()) {
        p1.hp -= 1;
        ai.attack_timer = 0.0f;
        sound::play_beep(320, 20);
    }
}

void ShadowFight::render() {
    grid_.clear(Color(5, 0, 10));
    for (int x = 0; x < N; ++x) grid_.set_pixel(x, kGroundY + 1, Color(40, 40, 40));

    const Color p1Color{255, 60, 60}, aiColor{60, 160, 255};
    draw_stick((int)std::lround(p1.x), (int)std::lround(p1.y), p1Color, 1, p1.attack_timer > 0.0f);
    draw_stick((int)std::lround(ai.x), (int)std::lround(ai.y), aiColor, -1, ai.attack_timer > 0.0f);

    draw_hp(1, 0, p1.hp, p1Color);
    draw_hp(10, 0, ai.hp, aiColor);
    grid_.render_text("VS", 7, 0, Color(255, 255, 0));

    if (game_over) {
        grid_.render_text(winner, 2, 7, Color(255, 255, 0));
        grid_.render_text("WINS", 2, 12, colors::White);
    }
}

void ShadowFight::draw_hp(int x, int y, int hp, const Color &c) {
    hp = std::max(0, std::min(kMaxHp, hp));
    const Color dim(std::max(10, c.r / 5), std::max(10, c.g / 5), std::max(10, c.b / 5));
    for (int i = 0; i < 9; ++i) grid_.set_pixel(x + i, y + 2, dim);
    for (int i = 0; i < hp; ++i) grid_.set_pixel(x + i, y + 2, c);
}

// Anchored at the feet.
void ShadowFight::draw_stick(int x, int y, const Color &c, int facing, bool punching) {
    grid_.set_pixel(x, y - 5, c);
    for (int dy = 1; dy < 4; ++dy) grid_.set_pixel(x, y - (5 - dy), c);

    grid_.set_pixel(x - 1, y - 1, c);
    grid_.set_pixel(x + 1, y - 1, c);
    grid_.set_pixel(x - 1, y, c);
    grid_.set_pixel(x + 1, y, c);

    const int armY = y - 3;
    grid_.set_pixel(x - 1, armY, c);
    grid_.set_pixel(x + 1, armY, c);
    if (punching) {
        grid_.set_pixel(x + 2 * facing, armY, c);
        grid_.set_pixel(x + 3 * facing, armY, c);
    }
}

void ShadowFight::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (game_over) {
        if (in.aPressed) reset();
        return;
    }

    if ((in.upPressed || in.bPressed) && p1.y >= kGroundY) {
        p1.vy = kJumpV;
        sound::play_beep(520, 25);
    }
    if (in.aPressed && p1.attack_cd <= 0.0f) {
        p1.attack_timer = kPunchTime;
        p1.attack_cd = kPlayerCooldown;
        sound::play_beep(740, 20);
    }

    if (in.leftHeld) p1.x -= kMoveStep;
    if (in.rightHeld) p1.x += kMoveStep;
    p1.x = std::max(1.0f, std::min(N - 2.0f, p1.x));
}
