// options.hpp - persisted console settings and the touch options screen
#pragma once
#include <string>
#include <vector>
#include "hardware.hpp"
#include "ui_button.hpp"

class LEDGrid;

namespace options {

struct Settings {
    bool sound = true;
    int ledSize;
    int ledSpacing;
    int ledGap;
    bool circular = true;
    bool gridOnTop = true;       // false: grid on the touch screen
    bool smoothCarousel = true;

    Settings();
};

// storage::data_path("options.cfg")
std::string default_path();

// key=value lines. Missing file keeps the current values; unknown keys are ignored.
bool load_settings(const std::string &path);
bool save_settings(const std::string &path);
// Parse one key/value pair into s. Returns false for unknown keys.
bool apply_setting(Settings &s, const char* key, const char* value);

Settings& current();
// Push the display settings to the grid (clamped by the grid).
void apply_to(LEDGrid &grid);
// Read the display settings back from the grid.
void capture_from(const LEDGrid &grid);

enum class Action { None, Cancel, SaveAndExit };

// Snapshot the settings so CANCEL can restore them.
void begin(LEDGrid &grid);
// Touch handling for the options screen. SELECT cancels.
Action update(const InputState &in, LEDGrid &grid);
// size -/+, spacing -/+, gap -/+, CANCEL, SAVE
const std::vector<UIButton>& screen_buttons();

#ifdef PLATFORM_3DS
// Bottom screen.
void render();
#endif

} // namespace options
