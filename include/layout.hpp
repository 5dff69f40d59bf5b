#pragma once

// Centralized layout constants for Grid Arcade
// Grid geometry, screen sizes and LED display ranges live here

namespace layout {
    // LED panel
    static constexpr int GRID_SIZE = 19;
    static constexpr int GRID_CENTER = GRID_SIZE / 2;

    // 3DS screens
    static constexpr int TOP_SCREEN_W = 400;
    static constexpr int TOP_SCREEN_H = 240;
    static constexpr int BOTTOM_SCREEN_W = 320;
    static constexpr int BOTTOM_SCREEN_H = 240;

    // LED display parameters (pixels). Defaults fit 19 LEDs on the 240px tall screens.
    static constexpr int LED_SIZE_DEFAULT = 10;
    static constexpr int LED_SIZE_MIN = 4;
    static constexpr int LED_SIZE_MAX = 16;
    static constexpr int LED_SPACING_DEFAULT = 2;
    static constexpr int LED_SPACING_MIN = 0;
    static constexpr int LED_SPACING_MAX = 8;
    static constexpr int LED_GAP_DEFAULT = 1;
    static constexpr int LED_GAP_MIN = 0;
    static constexpr int LED_GAP_MAX = 4;

    // Frame clock clamp used by games integrating input over dt
    static constexpr float MIN_INPUT_DT = 1.0f / 240.0f;
    static constexpr float MAX_INPUT_DT = 1.0f / 15.0f;
}
