// boot_screen.cpp - rows, then columns, then an expanding colour ring
#include <cmath>
#include "boot_screen.hpp"
#include "led_grid.hpp"

void BootScreen::update(float dt) {
    timer += dt;
    if (timer >= kDuration) running_ = false;
}

void BootScreen::render() {
    const int n = LEDGrid::kSize;
    grid_.clear();
    float progress = timer / kDuration;
    if (progress < 0.33f) {
        int lines = (int)(progress / 0.33f * n);
        for (int i = 0; i < lines; ++i) {
            Color c = hsv_to_rgb((float)((i * 20) % 360), 1.0f, 1.0f);
            for (int x = 0; x < n; ++x) grid_.set_pixel(x, i, c);
        }
    } else if (progress < 0.66f) {
        int lines = (int)((progress - 0.33f) / 0.33f * n);
        for (int i = 0; i < lines; ++i) {
            Color c = hsv_to_rgb((float)((i * 20) % 360), 1.0f, 1.0f);
            for (int y = 0; y < n; ++y) grid_.set_pixel(i, y, c);
        }
    } else {
        float stage = (progress - 0.66f) / 0.34f;
        const int center = n / 2;
        float radius = stage * (center * 1.5f);
        for (int y = 0; y < n; ++y) {
            for (int x = 0; x < n; ++x) {
                float dist = std::sqrt((float)((x - center) * (x - center) + (y - center) * (y - center)));
                float d = std::fabs(dist - radius);
                if (d >= 3.0f) continue;
                float hue = std::fmod(dist * 10.0f + timer * 100.0f, 360.0f);
                grid_.set_pixel(x, y, hsv_to_rgb(hue, 1.0f, 1.0f - d / 3.0f));
            }
        }
    }
}

void BootScreen::handle_input(const InputState &in) {
    if (in.aPressed || in.startPressed) running_ = false;
}
