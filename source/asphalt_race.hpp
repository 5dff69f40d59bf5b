// asphalt_race.hpp - pseudo-3D endless racer with traffic
#pragma once
#include <vector>
#include "game.hpp"
#include "layout.hpp"

class SpriteStore;

class AsphaltRace : public Game {
public:
    struct Car {
        float x;   // offset from road centre
        float y;
        bool passed = false;
    };

    // sprites may be null; the HUD then falls back to letters.
    AsphaltRace(LEDGrid &grid, const SpriteStore *sprites = nullptr);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "LR Steer  UP/A Gas  DOWN/B Brake  SELECT Menu"; }

    void reset();
    int road_half_width(int y) const;
    int road_center_at(int y) const;
    int player_screen_x() const;
    int player_screen_y() const { return kPlayerY; }
    bool check_collision() const;
    void spawn_traffic();

    static constexpr int kHorizonY = 4;
    static constexpr int kPlayerY = layout::GRID_SIZE - 3;
    static constexpr float kMinSpeed = 3.0f;
    static constexpr float kMaxSpeed = 13.0f;
    static constexpr float kStartSpeed = 7.5f;
    static constexpr float kSteerSpeed = 9.0f;  // px/s
    static constexpr float kAccel = 8.0f;       // speed units/s

    float player_x = 0.0f;  // offset from road centre at the player row
    float curve = 0.0f;
    float speed = kStartSpeed;
    float scroll = 0.0f;
    float distance = 0.0f;
    int score = 0;
    std::vector<Car> traffic;
    bool crashed = false;

private:
    void update_traffic(float dt);

    const SpriteStore *sprites_;
    float spawn_cd_ = 0.4f;
    float last_dt_ = 1.0f / 60.0f;
};
