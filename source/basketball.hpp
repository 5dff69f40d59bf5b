// basketball.hpp - 2v2 half-court basketball, one controlled player and three AI
#pragma once
#include <array>
#include "game.hpp"

class Basketball : public Game {
public:
    struct Player {
        float x, y;
        int team;      // 1 = red, 2 = white
        Color color;
    };

    explicit Basketball(LEDGrid &grid);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "DPAD Move  A Shoot  X Pass  SELECT Menu"; }

    // Chance that player idx scores from where they stand.
    float shot_probability(int idx, float hoopX, float hoopY) const;
    void shoot(int idx, float targetX, float targetY);
    void pass_ball(int from, int to);
    void reset_positions();

    Player &player(int idx) { return players[idx]; }
    int teammate_of(int idx) const { return idx ^ 1; }
    float hoop_x_for(int team) const { return team == 1 ? (float)kRightHoopX : (float)kLeftHoopX; }

    static constexpr int kLeftHoopX = 1;
    static constexpr int kRightHoopX = 17;
    static constexpr int kHoopY = 9;
    static constexpr int kMaxScore = 11;
    static constexpr float kShotArc = 0.7f;   // seconds
    static constexpr float kPassArc = 0.45f;
    static constexpr float kAiInterval = 0.06f;
    static constexpr float kMoveStep = 0.6f;  // controlled player, per frame
    static constexpr int kControlled = 0;
    static constexpr int kNoHolder = -1;

    std::array<Player, 4> players;
    float ball_x = 0.0f, ball_y = 0.0f;
    int ball_holder = 0;
    bool ball_in_air = false;
    float arc_progress = 0.0f;
    float arc_duration = kShotArc;
    float arc_start_x = 0.0f, arc_start_y = 0.0f;
    float arc_end_x = 0.0f, arc_end_y = 0.0f;
    int shooter = kNoHolder;
    int pass_target = kNoHolder;   // set while a pass is in flight
    float shot_chance = 0.0f;      // rolled when the shot lands

    int red_score = 0, white_score = 0;
    float score_anim_timer = 0.0f;
    int scoring_team = 0;
    bool started = false;
    bool game_over = false;
    int winner = 0;

private:
    void land_ball();
    void update_ai();
    void ai_with_ball(int idx);
    void ai_chase_ball(int idx);
    void ai_position_offense(int idx);
    void ai_defend(int idx);
    void move_towards(Player &p, float tx, float ty, float speed = 0.55f);
    bool opponent_within(int idx, float range) const;

    float ai_timer_ = 0.0f;
};
