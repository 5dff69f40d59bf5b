// asphalt_race.cpp - road perspective, traffic spawning, collisions and HUD
#include <algorithm>
#include <cmath>
#include "asphalt_race.hpp"
#include "led_grid.hpp"
#include "sprite_store.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;

AsphaltRace::AsphaltRace(LEDGrid &grid, const SpriteStore *sprites) : Game(grid), sprites_(sprites) {
    reset();
}

void AsphaltRace::reset() {
    player_x = 0.0f;
    curve = 0.0f;
    speed = kStartSpeed;
    scroll = 0.0f;
    distance = 0.0f;
    score = 0;
    traffic.clear();
    spawn_cd_ = 0.4f;
    crashed = false;
}

int AsphaltRace::road_half_width(int y) const {
    y = std::max(0, std::min(N - 1, y));
    float t = 0.0f;
    if (y > kHorizonY) t = (float)(y - kHorizonY) / (float)(N - 1 - kHorizonY);
    return (int)std::lround(3.0f + 5.0f * t);
}

int AsphaltRace::road_center_at(int y) const {
    if (y <= kHorizonY) return N / 2;
    float t = (float)(y - kHorizonY) / (float)(N - 1 - kHorizonY);
    return (int)std::lround(N / 2 + curve * t * t);
}

int AsphaltRace::player_screen_x() const {
    return (int)std::lround(road_center_at(kPlayerY) + player_x);
}

void AsphaltRace::spawn_traffic() {
    static const int kLanes[] = {-3, 0, 3};
    int hw = road_half_width(kHorizonY + 1);
    int ox = kLanes[randint(0, 2)];
    ox = std::max(-hw + 1, std::min(hw - 1, ox));
    traffic.push_back(Car{(float)ox, (float)(kHorizonY + 1)});
}

void AsphaltRace::update_traffic(float dt) {
    for (auto &car : traffic) car.y += speed * dt * 1.4f;

    auto gone = [this](const Car &car) {
        if (car.y <= N + 1) return false;
        if (car.passed) ++score;
        return true;
    };
    traffic.erase(std::remove_if(traffic.begin(), traffic.end(), gone), traffic.end());
}

bool AsphaltRace::check_collision() const {
    const int px = player_screen_x(), py = kPlayerY;
    for (const auto &car : traffic) {
        int cy = (int)std::lround(car.y);
        if (std::abs(cy - py) > 1) continue;
        int cx = road_center_at(cy) + (int)std::lround(car.x);
        if (std::abs(cx - px) <= 1) return true;
    }
    return false;
}

void AsphaltRace::update(float dt) {
    last_dt_ = std::max(layout::MIN_INPUT_DT, std::min(layout::MAX_INPUT_DT, dt));
    if (crashed) return;

    distance += speed * dt;
    scroll += speed * dt;

    curve = std::max(-5.0f, std::min(5.0f, curve + uniform(-0.7f, 0.7f) * dt));

    spawn_cd_ -= dt;
    if (spawn_cd_ <= 0.0f) {
        spawn_traffic();
        spawn_cd_ = std::max(0.35f, 1.1f - (speed - kMinSpeed) * 0.09f);
    }

    update_traffic(dt);

    for (auto &car : traffic)
        if (!car.passed && car.y > kPlayerY + 0.5f) car.passed = true;

    if (check_collision()) {
        crashed = true;
        sound::play_beep(220, 180);
    }
}

void AsphaltRace::render() {
    grid_.clear(Color(0, 0, 18));

    const Color grass{0, 40, 0}, road{25, 25, 25}, edge{220, 220, 220}, dash{255, 220, 80};
    for (int y = kHorizonY; y < N; ++y) {
        int center = road_center_at(y);
        int hw = road_half_width(y);
        for (int x = 0; x < N; ++x)
            grid_.set_pixel(x, y, (x < center - hw || x > center + hw) ? grass : road);
        grid_.set_pixel(center - hw, y, edge);
        grid_.set_pixel(center + hw, y, edge);
        if (y > kHorizonY && ((int)(scroll * 6.0f) + y) % 4 == 0) grid_.set_pixel(center, y, dash);
    }

    for (const auto &car : traffic) {
        int cy = (int)std::lround(car.y);
        if (cy < 0 || cy >= N) continue;
        int cx = road_center_at(cy) + (int)std::lround(car.x);
        const Color c1{255, 60, 60}, c2{200, 20, 20};
        grid_.set_pixel(cx, cy, c1);
        grid_.set_pixel(cx + 1, cy, c2);
        grid_.set_pixel(cx, cy + 1, c2);
        grid_.set_pixel(cx + 1, cy + 1, c1);
    }

    const int px = player_screen_x(), py = kPlayerY;
    const Color p1{60, 200, 255}, p2{20, 120, 200};
    grid_.set_pixel(px, py, p1);
    grid_.set_pixel(px + 1, py, p2);
    grid_.set_pixel(px, py + 1, p2);
    grid_.set_pixel(px + 1, py + 1, p1);

    const Sprite *dist = sprites_ ? sprites_->get("hud_race_dist") : nullptr;
    if (dist) draw_sprite(grid_, *dist, 0, 0);
    else grid_.render_text("R", 0, 0, Color(120, 200, 255));
    grid_.render_number((int)distance % 100, 4, 0, colors::White);

    const Sprite *sc = sprites_ ? sprites_->get("hud_race_score") : nullptr;
    if (sc) draw_sprite(grid_, *sc, 0, 6);
    else grid_.render_text("S", 0, 6, Color(255, 220, 80));
    grid_.render_number(score % 100, 4, 6, colors::White);

    if (crashed) grid_.render_text("CRASH", 0, 12, Color(255, 255, 0));
}

void AsphaltRace::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (crashed) {
        if (in.aPressed) reset();
        return;
    }

    float steer = 0.0f, accel = 0.0f;
    if (in.leftHeld) steer -= 1.0f;
    if (in.rightHeld) steer += 1.0f;
    if (in.upHeld || in.aHeld) accel += 1.0f;
    if (in.downHeld || in.bHeld) accel -= 1.0f;

    player_x += steer * kSteerSpeed * last_dt_;
    speed = std::max(kMinSpeed, std::min(kMaxSpeed, speed + accel * kAccel * last_dt_));

    // Keep the car on the road at its row
    int center = road_center_at(kPlayerY);
    int hw = road_half_width(kPlayerY);
    float px = std::max((float)(center - hw + 1), std::min((float)(center + hw - 2), center + player_x));
    player_x = px - center;
}
