// basketball.cpp - ball arcs, shot odds, AI roles and scoring
#include <algorithm>
#include <cmath>
#include "basketball.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;

static float dist(float ax, float ay, float bx, float by) {
    return std::sqrt((ax - bx) * (ax - bx) + (ay - by) * (ay - by));
}

Basketball::Basketball(LEDGrid &grid) : Game(grid) {
    players = {{
        {3.0f, 6.0f, 1, Color(200, 30, 45)},
        {3.0f, 12.0f, 1, Color(150, 20, 35)},
        {15.0f, 6.0f, 2, Color(200, 200, 200)},
        {15.0f, 12.0f, 2, Color(180, 180, 180)},
    }};
    ball_x = ball_y = N / 2.0f;
    ball_holder = 0;
}

void Basketball::reset_positions() {
    players[0].x = 3.0f;  players[0].y = 6.0f;
    players[1].x = 3.0f;  players[1].y = 12.0f;
    players[2].x = 15.0f; players[2].y = 6.0f;
    players[3].x = 15.0f; players[3].y = 12.0f;
    ball_x = ball_y = N / 2.0f;
    // Team that conceded takes the ball
    ball_holder = scoring_team == 1 ? 2 : 0;
    ball_in_air = false;
    pass_target = kNoHolder;
}

bool Basketball::opponent_within(int idx, float range) const {
    const Player &p = players[idx];
    for (const auto &o : players)
        if (o.team != p.team && dist(p.x, p.y, o.x, o.y) < range) return true;
    return false;
}

float Basketball::shot_probability(int idx, float hoopX, float hoopY) const {
    const Player &p = players[idx];
    float d = dist(p.x, p.y, hoopX, hoopY);
    float prob = std::max(0.05f, std::min(0.95f, 0.95f - 0.07f * d));
    if (opponent_within(idx, 1.5f)) prob *= 0.5f;
    return prob;
}

void Basketball::shoot(int idx, float targetX, float targetY) {
    const Player &p = players[idx];
    shot_chance = shot_probability(idx, targetX, targetY);
    arc_start_x = p.x; arc_start_y = p.y;
    arc_end_x = targetX; arc_end_y = targetY;
    arc_progress = 0.0f;
    arc_duration = kShotArc;
    ball_in_air = true;
    ball_holder = kNoHolder;
    shooter = idx;
    pass_target = kNoHolder;
    sound::play_beep(600, 30);
}

void Basketball::pass_ball(int from, int to) {
    arc_start_x = players[from].x; arc_start_y = players[from].y;
    arc_end_x = players[to].x; arc_end_y = players[to].y;
    arc_progress = 0.0f;
    arc_duration = kPassArc;
    ball_in_air = true;
    ball_holder = kNoHolder;
    pass_target = to;
}

void Basketball::land_ball() {
    if (pass_target != kNoHolder) {
        ball_holder = pass_target;
        pass_target = kNoHolder;
        return;
    }
    if (shooter == kNoHolder) return;

    const int team = players[shooter].team;
    if (uniform(0.0f, 1.0f) < shot_chance) {
        int &score = team == 1 ? red_score : white_score;
        score += 2;
        scoring_team = team;
        score_anim_timer = 1.0f;
        sound::play_beep(880, 80);
        if (score >= kMaxScore) {
            game_over = true;
            winner = team;
        }
    } else {
        ball_holder = kNoHolder;
        sound::play_beep(220, 60);
    }
    shooter = kNoHolder;
}

void Basketball::update(float dt) {
    if (score_anim_timer > 0.0f) {
        score_anim_timer -= dt;
        if (score_anim_timer <= 0.0f) {
            if (!game_over) reset_positions();
            scoring_team = 0;
        }
        return;
    }
    if (game_over || !started) return;

    if (ball_in_air) {
        arc_progress += dt / arc_duration;
        if (arc_progress >= 1.0f) {
            ball_in_air = false;
            ball_x = arc_end_x;
            ball_y = arc_end_y;
            land_ball();
        } else {
            ball_x = arc_start_x + (arc_end_x - arc_start_x) * arc_progress;
            ball_y = arc_start_y + (arc_end_y - arc_start_y) * arc_progress;
        }
    }

    ai_timer_ += dt;
    if (ai_timer_ >= kAiInterval) {
        ai_timer_ = 0.0f;
        update_ai();
    }

    if (ball_holder != kNoHolder && !ball_in_air) {
        ball_x = players[ball_holder].x;
        ball_y = players[ball_holder].y;
    }
}

void Basketball::update_ai() {
    for (int idx = 0; idx < 4; ++idx) {
        if (idx == kControlled) continue;
        if (ball_holder == idx) ai_with_ball(idx);
        else if (ball_holder == kNoHolder) { if (!ball_in_air) ai_chase_ball(idx); }
        else if (players[ball_holder].team == players[idx].team) ai_position_offense(idx);
        else ai_defend(idx);
    }
}

void Basketball::ai_with_ball(int idx) {
    Player &p = players[idx];
    float hx = hoop_x_for(p.team);
    float d = dist(p.x, p.y, hx, (float)kHoopY);
    bool pressured = opponent_within(idx, 3.0f);
    if (d < 6.0f && !pressured) shoot(idx, hx, (float)kHoopY);
    else if (pressured) pass_ball(idx, teammate_of(idx));
    else move_towards(p, hx, (float)kHoopY);
}

void Basketball::ai_chase_ball(int idx) {
    Player &p = players[idx];
    move_towards(p, ball_x, ball_y);
    if (dist(p.x, p.y, ball_x, ball_y) < 1.5f) ball_holder = idx;
}

void Basketball::ai_position_offense(int idx) {
    Player &p = players[idx];
    float tx = p.team == 1 ? 12.0f : 6.0f;
    float ty = idx % 2 == 0 ? 9.0f : 14.0f;
    move_towards(p, tx, ty, 0.45f);
}

void Basketball::ai_defend(int idx) {
    Player &p = players[idx];
    const Player &carrier = players[ball_holder];
    move_towards(p, carrier.x, carrier.y, 0.5f);
    if (dist(p.x, p.y, carrier.x, carrier.y) < 1.5f && chance(0.08f)) ball_holder = idx;
}

void Basketball::move_towards(Player &p, float tx, float ty, float speed) {
    float dx = tx - p.x, dy = ty - p.y;
    float d = std::sqrt(dx * dx + dy * dy);
    if (d <= 0.5f) return;
    p.x = std::max(1.0f, std::min((float)(N - 2), p.x + dx / d * speed));
    p.y = std::max(1.0f, std::min((float)(N - 2), p.y + dy / d * speed));
}

void Basketball::render() {
    grid_.clear(Color(20, 50, 20));

    if (score_anim_timer > 0.0f) {
        bool flash = ((int)(score_anim_timer * 8.0f)) % 2 != 0;
        Color bg = scoring_team == 1 ? (flash ? Color(200, 30, 45) : Color(100, 15, 22))
                                     : (flash ? Color(200, 200, 200) : Color(100, 100, 100));
        grid_.clear(bg);
        grid_.render_number(red_score, 3, 8, colors::White, 2);
        grid_.render_number(white_score, 11, 8, colors::White, 2);
        return;
    }
    if (game_over) {
        grid_.clear(winner == 1 ? Color(200, 30, 45) : Color(200, 200, 200));
        grid_.render_text(winner == 1 ? "RED" : "WHT", 4, 6, Color(255, 255, 0), 2);
        grid_.render_text("WINS", 2, 12, colors::White);
        return;
    }

    for (int y = 0; y < N; ++y) grid_.set_pixel(N / 2, y, colors::White);

    const Color hoop{255, 100, 0};
    for (int dy = -1; dy <= 1; ++dy) {
        grid_.set_pixel(kLeftHoopX, kHoopY + dy, hoop);
        grid_.set_pixel(kRightHoopX, kHoopY + dy, hoop);
    }

    for (int idx = 0; idx < 4; ++idx) {
        const Player &p = players[idx];
        Color c = p.color;
        if (idx == kControlled) c = Color(c.r + 50, c.g + 50, c.b + 50);
        grid_.set_pixel((int)p.x, (int)p.y, c);
    }

    grid_.set_pixel((int)ball_x, (int)ball_y, ball_in_air ? Color(255, 200, 100) : Color(255, 140, 0));

    grid_.render_number(red_score, 2, 1, colors::White);
    grid_.render_number(white_score, 14, 1, colors::White);
}

void Basketball::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }

    if (!started && (in.aPressed || in.startPressed)) { started = true; return; }
    if (!started || game_over) return;

    if (ball_holder == kControlled && !ball_in_air) {
        Player &me = players[kControlled];
        if (in.aPressed) shoot(kControlled, hoop_x_for(me.team), (float)kHoopY);
        else if (in.xPressed) pass_ball(kControlled, teammate_of(kControlled));
    }

    Player &me = players[kControlled];
    const float lo = 1.0f, hi = (float)(N - 2);
    if (in.upHeld) me.y = std::max(lo, me.y - kMoveStep);
    if (in.downHeld) me.y = std::min(hi, me.y + kMoveStep);
    if (in.leftHeld) me.x = std::max(lo, me.x - kMoveStep);
    if (in.rightHeld) me.x = std::min(hi, me.x + kMoveStep);
}
