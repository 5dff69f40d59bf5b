// boot_screen.hpp - rainbow scan start-up animation
#pragma once
#include "game.hpp"

class BootScreen : public Game {
public:
    explicit BootScreen(LEDGrid &grid) : Game(grid) {}

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "A/START Skip"; }

    static constexpr float kDuration = 3.0f;
    float timer = 0.0f;
};
