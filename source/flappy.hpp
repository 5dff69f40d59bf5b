// flappy.hpp - one-button flyer through scrolling pipes
#pragma once
#include <vector>
#include "game.hpp"

class Flappy : public Game {
public:
    struct Pipe {
        float x;
        int gap;          // gap centre row
        bool passed = false;
    };

    explicit Flappy(LEDGrid &grid);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "A Flap  B Restart  SELECT Menu"; }

    void reset();
    void flap();

    static constexpr float kGravity = 18.0f;
    static constexpr float kFlapVelocity = -7.0f;
    static constexpr float kPipeSpeed = 7.0f;
    static constexpr int kGapSize = 6;
    static constexpr int kBirdX = 5;

    std::vector<Pipe> pipes;
    float bird_y = 0.0f;
    float bird_vy = 0.0f;
    int score = 0;
    bool game_over = false;

private:
    void spawn_pipe(float x);
    void die();
};
