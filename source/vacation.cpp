// vacation.cpp - scene painters and gallery navigation
#include <cmath>
#include <algorithm>
#include <cstdlib>
#include "vacation.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static constexpr int N = LEDGrid::kSize;

const char* VacationGallery::scene_name(int index) {
    return index == 0 ? "BEACH" : "FALLS";
}

void VacationGallery::update(float dt) {
    if (animate) t += dt;
}

void VacationGallery::render() {
    grid_.clear();
    if (scene_index == 0) render_beach();
    else render_waterfall();

    grid_.render_text("VACAY", 1, 0, Color(120, 200, 255));
    grid_.render_text(scene_name(scene_index), 1, 6, Color(255, 255, 0));

    const Color arrow{130, 130, 130};
    draw_left_arrow(grid_, 1, 10, arrow);
    draw_right_arrow(grid_, 17, 10, arrow);
}

void VacationGallery::render_beach() {
    for (int y = 0; y < 6; ++y)
        for (int x = 0; x < N; ++x) grid_.set_pixel(x, y, Color(20, 60 + y * 10, 120 + y * 10));

    static const int sun[][2] = {{0,0},{-1,0},{1,0},{0,-1},{0,1}};
    for (const auto &d : sun) grid_.set_pixel(14 + d[0], 2 + d[1], Color(255, 220, 80));

    for (int y = 6; y < 13; ++y)
        for (int x = 0; x < N; ++x) grid_.set_pixel(x, y, Color(0, 80 + (y - 6) * 8, 180));

    if (animate) {
        float phase = t * 3.0f;
        for (int x = 0; x < N; ++x) {
            int y = 8 + (int)std::lround((std::sin(phase + x * 0.6f) + 1.0f) * 0.8f);
            grid_.set_pixel(x, y, Color(120, 220, 255));
        }
    }

    grid_.fill_rect(0, 13, N, 6, Color(180, 140, 70));

    // palm
    for (int y = 9; y < 16; ++y) grid_.set_pixel(3, y, Color(40, 30, 20));
    static const int fronds[][2] = {{-2,8},{-1,8},{0,8},{1,8},{2,8},{-1,9},{1,9}};
    for (const auto &f : fronds) grid_.set_pixel(3 + f[0], f[1], Color(20, 100, 40));
}

void VacationGallery::render_waterfall() {
    for (int y = 0; y < 6; ++y)
        for (int x = 0; x < N; ++x) grid_.set_pixel(x, y, Color(10, 20 + y * 8, 60 + y * 12));

    for (int x = 0; x < N; ++x) {
        int peak = 5 - (int)(std::abs(x - 6) * 0.6f);
        for (int y = std::max(0, peak); y < 7; ++y) grid_.set_pixel(x, y, Color(50, 60, 70));
    }

    const int fallX = 10;
    for (int y = 4; y < 15; ++y) {
        int shade = 200 + (y % 2) * 30;
        if (animate) shade = 180 + (int)((std::sin(t * 6.0f + y) + 1.0f) * 40.0f);
        grid_.set_pixel(fallX, y, Color(80, shade, 255));
        grid_.set_pixel(fallX + 1, y, Color(60, shade - 20, 230));
    }

    grid_.fill_rect(0, 15, N, 4, Color(0, 80, 140));

    if (animate) {
        for (int x = 0; x < N; x += 2) {
            float hue = std::fmod(t * 80.0f + x * 15.0f, 360.0f);
            grid_.set_pixel(x, 16 + (x % 3 == 0 ? 1 : 0), hsv_to_rgb(hue, 0.4f, 0.8f));
        }
    }

    static const int rocks[][2] = {{2,17},{3,18},{15,17},{16,18}};
    for (const auto &r : rocks) grid_.set_pixel(r[0], r[1], Color(70, 70, 70));
}

void VacationGallery::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    if (in.leftPressed) {
        scene_index = (scene_index + kNumScenes - 1) % kNumScenes;
        sound::play_beep(420, 35);
    } else if (in.rightPressed) {
        scene_index = (scene_index + 1) % kNumScenes;
        sound::play_beep(520, 35);
    } else if (in.aPressed) {
        animate = !animate;
        sound::play_beep(660, 50);
    }
}
