// pong.cpp - ball physics, paddle spin, scoring flashes and a simple AI
#include <algorithm>
#include <cmath>
#include "pong.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;
static constexpr float kQuarterPi = 0.78539816f;

Pong::Pong(LEDGrid &grid) : Game(grid) {
    left_paddle_y = right_paddle_y = (float)((N - kPaddleHeight) / 2);
    ball_x = ball_y = N / 2.0f;
}

void Pong::reset_ball() {
    ball_x = ball_y = N / 2.0f;
    float angle = uniform(-kQuarterPi, kQuarterPi);
    float dir = randint(0, 1) ? 1.0f : -1.0f;
    ball_vx = std::cos(angle) * kBallSpeed * dir;
    ball_vy = std::sin(angle) * kBallSpeed;
    trail.clear();
}

void Pong::add_spin(int ballRow, float paddleY) {
    float hit = ((float)ballRow - paddleY) / kPaddleHeight; // 0..1
    ball_vy += (hit - 0.5f) * kBallSpeed * 0.5f;
    const float maxVy = kBallSpeed * 0.8f;
    ball_vy = std::max(-maxVy, std::min(maxVy, ball_vy));
}

void Pong::score_point(Side side) {
    int &score = side == Side::Left ? left_score : right_score;
    ++score;
    scoring = side;
    score_anim_timer = 1.5f;
    started = false;
    sound::play_beep(220, 200);
    if (score >= kMaxScore) {
        game_over = true;
        winner = side;
        sound::play_melody({440, 554, 659, 880}, 150);
    }
}

void Pong::update(float dt) {
    clock += dt;
    if (!mode_selected) return;

    if (score_anim_timer > 0.0f) {
        score_anim_timer -= dt;
        if (score_anim_timer <= 0.0f) {
            scoring = Side::None;
            if (!game_over) { reset_ball(); started = true; }
        }
        return;
    }
    if (game_over || !started) return;

    ball_x += ball_vx * dt;
    ball_y += ball_vy * dt;
    trail.emplace_back((int)ball_x, (int)ball_y);
    if (trail.size() > kMaxTrail) trail.pop_front();

    if (ball_y <= 0.0f || ball_y >= N - 1) {
        ball_vy = -ball_vy;
        ball_y = std::max(0.0f, std::min((float)(N - 1), ball_y));
        sound::play_beep(330, 50);
    }

    int bx = (int)ball_x, by = (int)ball_y;
    if (bx <= 1 && left_paddle_y <= by && by < left_paddle_y + kPaddleHeight) {
        ball_vx = std::fabs(ball_vx);
        ball_x = 2.0f;
        add_spin(by, left_paddle_y);
        sound::play_beep(440, 50);
    }
    if (bx >= N - 2 && right_paddle_y <= by && by < right_paddle_y + kPaddleHeight) {
        ball_vx = -std::fabs(ball_vx);
        ball_x = (float)(N - 3);
        add_spin(by, right_paddle_y);
        sound::play_beep(440, 50);
    }

    if (ball_x < 0.0f) score_point(Side::Right);
    else if (ball_x >= N) score_point(Side::Left);

    if (!two_player && started && !game_over && score_anim_timer <= 0.0f) update_ai(dt);
}

void Pong::update_ai(float dt) {
    float target = ball_y - kPaddleHeight / 2.0f + uniform(-0.3f, 0.3f);
    float diff = target - right_paddle_y;
    float move = std::max(0.0f, kPaddleSpeed * kAiSpeed * dt);
    if (std::fabs(diff) <= 0.25f) return;
    if (diff > 0) right_paddle_y = std::min((float)(N - kPaddleHeight), right_paddle_y + move);
    else right_paddle_y = std::max(0.0f, right_paddle_y - move);
}

void Pong::render() {
    grid_.clear();
    if (!mode_selected) { render_mode_selection(); return; }
    if (score_anim_timer > 0.0f) { render_score_animation(); return; }
    if (game_over) { render_game_over(); return; }

    render_paddle(0, (int)left_paddle_y, Color(0, 255, 255));
    render_paddle(N - 1, (int)right_paddle_y, Color(255, 0, 255));

    for (size_t i = 0; i < trail.size(); ++i) {
        float intensity = (float)(i + 1) / trail.size();
        float hue = std::fmod(clock * 100.0f + i * 30.0f, 360.0f);
        grid_.set_pixel(trail[i].first, trail[i].second, hsv_to_rgb(hue, 1.0f, intensity * 0.6f));
    }
    grid_.set_pixel((int)ball_x, (int)ball_y, colors::White);

    grid_.render_number(left_score, 3, 1, Color(0, 255, 255));
    grid_.render_number(right_score, 13, 1, Color(255, 0, 255));

    for (int y = 0; y < N; y += 2) grid_.set_pixel(N / 2, y, Color(50, 50, 50));
}

void Pong::render_paddle(int x, int y, const Color &c) {
    for (int i = 0; i < kPaddleHeight; ++i) grid_.set_pixel(x, y + i, c);
}

void Pong::render_mode_selection() {
    const Color on{0, 255, 0}, off{100, 100, 100};
    grid_.render_text("MODE", 4, 2, Color(255, 255, 0));
    grid_.render_text("1P", 3, 8, mode_index == 0 ? on : off);
    grid_.render_text("2P", 11, 8, mode_index == 1 ? on : off);
    grid_.render_text("LR", 5, 14, Color(150, 150, 150));
}

void Pong::render_score_animation() {
    bool flash = ((int)(score_anim_timer * 10.0f)) % 2 != 0;
    const int half = N / 2;
    if (scoring == Side::Left) {
        Color c = flash ? Color(0, 255, 255) : Color(0, 150, 150);
        for (int x = 0; x < half; ++x)
            for (int y = 0; y < N; ++y)
                grid_.set_pixel(x, y, scale_color(c, 1.0f - (float)x / half));
    } else {
        Color c = flash ? Color(255, 0, 255) : Color(150, 0, 150);
        for (int x = half; x < N; ++x)
            for (int y = 0; y < N; ++y)
                grid_.set_pixel(x, y, scale_color(c, (float)(x - half) / half));
    }
    grid_.render_number(left_score, 3, 8, colors::White, 2);
    grid_.render_number(right_score, 11, 8, colors::White, 2);
}

void Pong::render_game_over() {
    for (int y = 0; y < N; ++y)
        for (int x = 0; x < N; ++x)
            grid_.set_pixel(x, y, hsv_to_rgb(std::fmod(x * 10.0f + y * 10.0f + clock * 100.0f, 360.0f), 0.5f, 0.3f));
    if (winner == Side::Left) grid_.render_text("P1", 5, 6, Color(0, 255, 255), 2);
    else grid_.render_text("P2", 5, 6, Color(255, 0, 255), 2);
    grid_.render_text("WINS", 2, 12, Color(255, 255, 0));
}

void Pong::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (!mode_selected) {
        if (in.leftPressed) mode_index = 0;
        else if (in.rightPressed) mode_index = 1;
        else if (in.aPressed || in.startPressed) {
            mode_selected = true;
            two_player = (mode_index == 1);
            reset_ball();
        }
    } else if (!started && !game_over && score_anim_timer <= 0.0f) {
        if (in.aPressed || in.startPressed) started = true;
    }

    if (mode_selected && !game_over) {
        const float maxY = (float)(N - kPaddleHeight);
        if (in.upHeld) left_paddle_y = std::max(0.0f, left_paddle_y - kMoveStep);
        if (in.downHeld) left_paddle_y = std::min(maxY, left_paddle_y + kMoveStep);
        if (two_player) {
            if (in.xHeld) right_paddle_y = std::max(0.0f, right_paddle_y - kMoveStep);
            if (in.bHeld) right_paddle_y = std::min(maxY, right_paddle_y + kMoveStep);
        }
    }
}
