// flappy.cpp - gravity, pipe recycling, gap collisions and scoring
#include <cmath>
#include "flappy.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;

Flappy::Flappy(LEDGrid &grid) : Game(grid) {
    reset();
}

void Flappy::reset() {
    score = 0;
    game_over = false;
    bird_y = (float)(N / 2);
    bird_vy = 0.0f;
    pipes.clear();
    spawn_pipe((float)(N + 2));
    spawn_pipe((float)(N + 10));
}

void Flappy::spawn_pipe(float x) {
    pipes.push_back(Pipe{x, randint(5, N - 6)});
}

void Flappy::flap() {
    bird_vy = kFlapVelocity;
    sound::play_beep(660, 30);
}

void Flappy::update(float dt) {
    if (game_over) return;

    bird_vy += kGravity * dt;
    bird_y += bird_vy * dt;

    for (auto &p : pipes) p.x -= kPipeSpeed * dt;

    while (!pipes.empty() && pipes.front().x < -2.0f) {
        pipes.erase(pipes.begin());
        spawn_pipe((float)(N + 2));
    }

    if (bird_y < 0.0f || bird_y > N - 1) { die(); return; }

    const int by = (int)std::lround(bird_y);
    for (auto &p : pipes) {
        if ((int)std::lround(p.x) == kBirdX) {
            int gapTop = p.gap - kGapSize / 2;
            int gapBot = p.gap + kGapSize / 2;
            if (by < gapTop || by > gapBot) { die(); return; }
        }
        if (p.x < kBirdX && !p.passed) {
            p.passed = true;
            ++score;
            sound::play_beep(880, 45);
        }
    }
}

void Flappy::die() {
    game_over = true;
    sound::play_beep(220, 150);
}

void Flappy::render() {
    grid_.clear(Color(0, 0, 25));

    for (const auto &p : pipes) {
        int px = (int)std::lround(p.x);
        int gapTop = p.gap - kGapSize / 2;
        int gapBot = p.gap + kGapSize / 2;
        for (int y = 0; y < N; ++y) {
            if (y >= gapTop && y <= gapBot) continue;
            grid_.set_pixel(px, y, Color(0, 200, 80));
            grid_.set_pixel(px + 1, y, Color(0, 150, 60));
        }
    }

    const int by = (int)std::lround(bird_y);
    grid_.set_pixel(kBirdX, by, Color(255, 230, 60));
    grid_.set_pixel(kBirdX, by + 1, Color(255, 230, 60));
    grid_.set_pixel(kBirdX + 1, by, Color(255, 180, 0));
    grid_.set_pixel(kBirdX + 1, by + 1, Color(255, 180, 0));

    grid_.render_text("F", 0, 0, Color(120, 200, 255));
    grid_.render_number(score, 4, 0, colors::White);

    if (game_over) {
        grid_.render_text("OVER", 2, 7, Color(255, 255, 0));
        grid_.render_text("R", 8, 13, Color(150, 150, 150));
    }
}

void Flappy::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (game_over) {
        if (in.bPressed) reset();
        return;
    }
    if (in.aPressed) flap();
}
