// snake.hpp - classic snake inside the panel walls
#pragma once
#include <deque>
#include <utility>
#include "game.hpp"

class Snake : public Game {
public:
    using Pos = std::pair<int,int>;

    explicit Snake(LEDGrid &grid);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "DPAD Move  A Restart  SELECT Menu"; }

    void reset();
    // Advance one cell in the buffered direction.
    void step();
    // Buffer a turn; a direct reversal is ignored.
    void set_next_dir(Pos d);
    void spawn_food();

    static constexpr float kTickRate = 8.0f; // moves per second

    std::deque<Pos> snake; // tail first, head last
    Pos direction{1, 0};
    Pos next_direction{1, 0};
    Pos food{0, 0};
    int score = 0;
    bool game_over = false;

private:
    void die();
    bool occupied(const Pos &p) const;

    float accum_ = 0.0f;
};
