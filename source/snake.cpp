// snake.cpp - fixed-rate stepping, growth and wall/self collisions
#include <algorithm>
#include <vector>
#include "snake.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;

Snake::Snake(LEDGrid &grid) : Game(grid) {
    reset();
}

void Snake::reset() {
    game_over = false;
    score = 0;
    const int c = N / 2;
    snake.assign({{c - 1, c}, {c, c}, {c + 1, c}});
    direction = next_direction = {1, 0};
    accum_ = 0.0f;
    spawn_food();
}

bool Snake::occupied(const Pos &p) const {
    return std::find(snake.begin(), snake.end(), p) != snake.end();
}

void Snake::spawn_food() {
    std::vector<Pos> free;
    for (int y = 0; y < N; ++y)
        for (int x = 0; x < N; ++x)
            if (!occupied({x, y})) free.emplace_back(x, y);
    food = free.empty() ? Pos{0, 0} : free[(size_t)randint(0, (int)free.size() - 1)];
}

void Snake::update(float dt) {
    if (game_over) return;
    accum_ += dt;
    const float stepTime = 1.0f / kTickRate;
    while (accum_ >= stepTime && !game_over) {
        accum_ -= stepTime;
        step();
    }
}

void Snake::step() {
    direction = next_direction;
    Pos head = snake.back();
    Pos next{head.first + direction.first, head.second + direction.second};

    if (next.first < 0 || next.first >= N || next.second < 0 || next.second >= N) { die(); return; }

    // Moving into the tail is fine unless we grow this step
    bool grows = next == food;
    if (occupied(next) && !(next == snake.front() && !grows)) { die(); return; }

    snake.push_back(next);
    if (grows) {
        ++score;
        sound::play_beep(880, 60);
        spawn_food();
    } else {
        snake.pop_front();
    }
}

void Snake::die() {
    game_over = true;
    sound::play_beep(220, 150);
}

void Snake::set_next_dir(Pos d) {
    if (direction.first == -d.first && direction.second == -d.second) return;
    next_direction = d;
    sound::play_beep(520, 20);
}

void Snake::render() {
    grid_.clear();
    grid_.set_pixel(food.first, food.second, Color(255, 60, 60));
    for (size_t i = 0; i < snake.size(); ++i) {
        bool head = i + 1 == snake.size();
        grid_.set_pixel(snake[i].first, snake[i].second, head ? Color(0, 255, 0) : Color(0, 150, 0));
    }
    grid_.render_text("S", 0, 0, Color(120, 255, 120));
    grid_.render_number(score, 4, 0, colors::White);
    if (game_over) {
        grid_.render_text("OVER", 2, 7, Color(255, 255, 0));
        grid_.render_text("SP", 6, 13, Color(150, 150, 150));
    }
}

void Snake::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (game_over) {
        if (in.aPressed || in.startPressed) reset();
        return;
    }
    if (in.upPressed) set_next_dir({0, -1});
    else if (in.downPressed) set_next_dir({0, 1});
    else if (in.leftPressed) set_next_dir({-1, 0});
    else if (in.rightPressed) set_next_dir({1, 0});
}
