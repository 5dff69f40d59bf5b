// vacation.hpp - ambient picture gallery (beach and waterfall)
#pragma once
#include "game.hpp"

class VacationGallery : public Game {
public:
    explicit VacationGallery(LEDGrid &grid) : Game(grid) {}

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "LR Scene  A Animate  SELECT Menu"; }

    static constexpr int kNumScenes = 2;
    static const char* scene_name(int index);

    int scene_index = 0;
    bool animate = true;
    float t = 0.0f;

private:
    void render_beach();
    void render_waterfall();
};
