// shadow_fight.hpp - 1v1 stick fighter against a simple AI
#pragma once
#include <string>
#include "game.hpp"

class ShadowFight : public Game {
public:
    struct Fighter {
        float x, y;
        float vy = 0.0f;
        int hp = kMaxHp;
        float attack_cd = 0.0f;
        float attack_timer = 0.0f;  // > 0 while the punch is live
    };

    explicit ShadowFight(LEDGrid &grid);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "LR Move  UP/B Jump  A Punch  SELECT Menu"; }

    void reset();
    // Applies live punches in both directions.
    void resolve_hits();

    static constexpr int kMaxHp = 10;
    static constexpr int kGroundY = 15;
    static constexpr float kGravity = 24.0f;
    static constexpr float kJumpV = -10.0f;
    static constexpr float kPunchTime = 0.18f;
    static constexpr float kPlayerCooldown = 0.5f;
    static constexpr float kAiCooldown = 0.6f;
    static constexpr float kAiChaseSpeed = 2.2f;
    static constexpr float kMoveStep = 4.0f / 60.0f;  // per frame while held

    Fighter p1{5.0f, (float)kGroundY};
    Fighter ai{13.0f, (float)kGroundY};
    bool game_over = false;
    std::string winner;

private:
    void apply_physics(Fighter &f, float dt);
    void update_ai(float dt);
    bool in_reach() const;
    void draw_stick(int x, int y, const Color &c, int facing, bool punching);
    void draw_hp(int x, int y, int hp, const Color &c);
};
