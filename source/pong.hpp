// pong.hpp - two paddle Pong with AI or second player
#pragma once
#include <deque>
#include <utility>
#include "game.hpp"

class Pong : public Game {
public:
    explicit Pong(LEDGrid &grid);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "P1 UP/DOWN  P2 X/B  A Start  SELECT Menu"; }

    void reset_ball();

    enum class Side { None, Left, Right };

    static constexpr int kPaddleHeight = 4;
    static constexpr float kPaddleSpeed = 12.0f;
    static constexpr float kBallSpeed = 8.0f;
    static constexpr int kMaxScore = 5;
    static constexpr size_t kMaxTrail = 5;
    static constexpr float kAiSpeed = 0.8f;
    static constexpr float kMoveStep = 0.8f; // paddle step per frame while held

    bool mode_selected = false;
    int mode_index = 0; // 0 = vs AI, 1 = 2P
    bool two_player = false;
    float left_paddle_y, right_paddle_y;
    float ball_x, ball_y;
    float ball_vx = 0.0f, ball_vy = 0.0f;
    std::deque<std::pair<int,int>> trail;
    int left_score = 0, right_score = 0;
    float score_anim_timer = 0.0f;
    Side scoring = Side::None;
    bool started = false;
    bool game_over = false;
    Side winner = Side::None;
    float clock = 0.0f;

private:
    void add_spin(int ballRow, float paddleY);
    void update_ai(float dt);
    void score_point(Side side);
    void render_paddle(int x, int y, const Color &c);
    void render_mode_selection();
    void render_score_animation();
    void render_game_over();
};
