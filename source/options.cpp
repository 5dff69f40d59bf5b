// options.cpp - settings file and the options screen
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <vector>
#ifdef PLATFORM_3DS
#include <citro2d.h>
#endif
#include "options.hpp"
#include "led_grid.hpp"
#include "sound.hpp"
#include "storage.hpp"
#include "ui_button.hpp"
#include "ui_dropdown.hpp"

namespace options {

namespace ui {
    constexpr int LABEL_X = 24;
    constexpr int VALUE_X = 150;
    constexpr int STEP_X = 200, STEP_W = 28, STEP_H = 18, STEP_GAP = 6;
    constexpr int ROW_SIZE = 34, ROW_SPACING = 56, ROW_GAP = 78;
    constexpr int DD_X = 150, DD_W = 120, DD_H = 18, ITEM_H = 16;
    constexpr int DD_STYLE_Y = 102, DD_SCREEN_Y = 126;
    constexpr int BOX_X = 150, BOX_SZ = 14;
    constexpr int BOX_SOUND_Y = 154, BOX_SMOOTH_Y = 178;
    constexpr int CANCEL_X = 60, SAVE_X = 200, BTN_Y = 208, BTN_W = 60, BTN_H = 20;
}

Settings::Settings()
    : ledSize(layout::LED_SIZE_DEFAULT), ledSpacing(layout::LED_SPACING_DEFAULT), ledGap(layout::LED_GAP_DEFAULT) {}

static Settings settings;
static Settings entrySnapshot;   // restored by CANCEL

static std::vector<std::string> styleItems = {"Circle", "Square"};
static std::vector<std::string> screenItems = {"Top", "Bottom"};
static UIDropdown styleDD;
static UIDropdown screenDD;
static UICheckbox soundBox;
static UICheckbox smoothBox;
static std::vector<UIButton> buttons; // size -/+, spacing -/+, gap -/+, CANCEL, SAVE
static LEDGrid* activeGrid = nullptr;  // set between begin() and the end of update()

static int clampi(int v, int lo, int hi) { return v < lo ? lo : (v > hi ? hi : v); }

static bool parse_bool(const char* v) {
    return !(strcmp(v, "0") == 0 || strcasecmp(v, "false") == 0 || strcasecmp(v, "off") == 0);
}

std::string default_path() { return storage::data_path("options.cfg"); }

Settings& current() { return settings; }

bool apply_setting(Settings &s, const char* key, const char* val) {
    if (strcmp(key, "sound") == 0) s.sound = parse_bool(val);
    else if (strcmp(key, "led_size") == 0) s.ledSize = clampi(atoi(val), layout::LED_SIZE_MIN, layout::LED_SIZE_MAX);
    else if (strcmp(key, "led_spacing") == 0) s.ledSpacing = clampi(atoi(val), layout::LED_SPACING_MIN, layout::LED_SPACING_MAX);
    else if (strcmp(key, "led_gap") == 0) s.ledGap = clampi(atoi(val), layout::LED_GAP_MIN, layout::LED_GAP_MAX);
    else if (strcmp(key, "style") == 0) s.circular = strcasecmp(val, "square") != 0;
    else if (strcmp(key, "screen") == 0) s.gridOnTop = strcasecmp(val, "bottom") != 0;
    else if (strcmp(key, "carousel") == 0) s.smoothCarousel = strcasecmp(val, "instant") != 0;
    else return false;
    return true;
}

bool load_settings(const std::string &path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) return false;
    char key[32]; char val[32];
    while (fscanf(f, "%31[^=]=%31s\n", key, val) == 2) {
        if (!apply_setting(settings, key, val)) {
            char buf[96]; snprintf(buf, sizeof buf, "options: unknown key %s\n", key); hw_log(buf);
        }
    }
    fclose(f);
    sound::set_enabled(settings.sound);
    return true;
}

bool save_settings(const std::string &path) {
    if (!storage::ensure_parent_dir(path)) return false;
    FILE* f = fopen(path.c_str(), "wb");
    if (!f) {
        char buf[128]; snprintf(buf, sizeof buf, "options: cannot write %s\n", path.c_str()); hw_log(buf);
        return false;
    }
    fprintf(f, "sound=%s\n", settings.sound ? "1" : "0");
    fprintf(f, "led_size=%d\n", settings.ledSize);
    fprintf(f, "led_spacing=%d\n", settings.ledSpacing);
    fprintf(f, "led_gap=%d\n", settings.ledGap);
    fprintf(f, "style=%s\n", settings.circular ? "circle" : "square");
    fprintf(f, "screen=%s\n", settings.gridOnTop ? "top" : "bottom");
    fprintf(f, "carousel=%s\n", settings.smoothCarousel ? "smooth" : "instant");
    fclose(f);
    return true;
}

void apply_to(LEDGrid &grid) {
    grid.set_display(settings.ledSize, settings.ledSpacing, settings.ledGap, settings.circular);
}

void capture_from(const LEDGrid &grid) {
    settings.ledSize = grid.led_size();
    settings.ledSpacing = grid.led_spacing();
    settings.ledGap = grid.led_gap();
    settings.circular = grid.circular();
}

static bool differs(const Settings &a, const Settings &b) {
    return a.sound != b.sound || a.ledSize != b.ledSize || a.ledSpacing != b.ledSpacing || a.ledGap != b.ledGap
        || a.circular != b.circular || a.gridOnTop != b.gridOnTop || a.smoothCarousel != b.smoothCarousel;
}

static void sync_widgets() {
    styleDD.selectedIndex = settings.circular ? 0 : 1;
    screenDD.selectedIndex = settings.gridOnTop ? 0 : 1;
    soundBox.checked = settings.sound;
    smoothBox.checked = settings.smoothCarousel;
    if (buttons.size() < 8) return;
    // Steppers go dim at their limits; SAVE lights up once something changed
    buttons[0].enabled = settings.ledSize > layout::LED_SIZE_MIN;
    buttons[1].enabled = settings.ledSize < layout::LED_SIZE_MAX;
    buttons[2].enabled = settings.ledSpacing > layout::LED_SPACING_MIN;
    buttons[3].enabled = settings.ledSpacing < layout::LED_SPACING_MAX;
    buttons[4].enabled = settings.ledGap > layout::LED_GAP_MIN;
    buttons[5].enabled = settings.ledGap < layout::LED_GAP_MAX;
    buttons[7].highlighted = differs(settings, entrySnapshot);
}

const std::vector<UIButton>& screen_buttons() { return buttons; }

static UIButton stepper(int x, int y, const char* label, void (*tap)()) {
    UIButton b;
    b.x = x; b.y = y; b.w = ui::STEP_W; b.h = ui::STEP_H;
    b.label = label;
    b.color = ui_rgba(40,40,60);
    b.onTap = tap;
    return b;
}

static void adjust(void (LEDGrid::*fn)(int), int delta) {
    if (!activeGrid) return;
    (activeGrid->*fn)(delta);
    capture_from(*activeGrid);
}

void begin(LEDGrid &grid) {
    capture_from(grid);
    entrySnapshot = settings;

    const int plusX = ui::STEP_X + ui::STEP_W + ui::STEP_GAP;
    buttons.clear();
    buttons.push_back(stepper(ui::STEP_X, ui::ROW_SIZE, "-", [](){ adjust(&LEDGrid::adjust_led_size, -1); }));
    buttons.push_back(stepper(plusX, ui::ROW_SIZE, "+", [](){ adjust(&LEDGrid::adjust_led_size, 1); }));
    buttons.push_back(stepper(ui::STEP_X, ui::ROW_SPACING, "-", [](){ adjust(&LEDGrid::adjust_led_spacing, -1); }));
    buttons.push_back(stepper(plusX, ui::ROW_SPACING, "+", [](){ adjust(&LEDGrid::adjust_led_spacing, 1); }));
    buttons.push_back(stepper(ui::STEP_X, ui::ROW_GAP, "-", [](){ adjust(&LEDGrid::adjust_led_gap, -1); }));
    buttons.push_back(stepper(plusX, ui::ROW_GAP, "+", [](){ adjust(&LEDGrid::adjust_led_gap, 1); }));
    UIButton b;
    b = {}; b.x=ui::CANCEL_X; b.y=ui::BTN_Y; b.w=ui::BTN_W; b.h=ui::BTN_H; b.label="CANCEL"; b.color=ui_rgba(50,30,30); buttons.push_back(b);
    b = {}; b.x=ui::SAVE_X; b.y=ui::BTN_Y; b.w=ui::BTN_W; b.h=ui::BTN_H; b.label="SAVE"; b.color=ui_rgba(30,50,30); buttons.push_back(b);

    for (UIDropdown* dd : {&styleDD, &screenDD}) {
        *dd = {};
        dd->x = ui::DD_X; dd->w = ui::DD_W; dd->h = ui::DD_H; dd->itemHeight = ui::ITEM_H;
        dd->headerColor = ui_rgba(40,40,60);
        dd->arrowColor = ui_rgba(55,55,85);
        dd->itemColor = ui_rgba(50,50,80);
        dd->itemSelColor = ui_rgba(70,70,110);
    }
    styleDD.y = ui::DD_STYLE_Y;
    ui_dropdown_set_items(styleDD, styleItems);
    styleDD.onSelect = [](int sel){
        settings.circular = sel == 0;
        if (activeGrid && activeGrid->circular() != settings.circular) activeGrid->toggle_style();
    };
    screenDD.y = ui::DD_SCREEN_Y;
    ui_dropdown_set_items(screenDD, screenItems);
    screenDD.onSelect = [](int sel){ settings.gridOnTop = sel == 0; };

    soundBox = {}; soundBox.x = ui::BOX_X; soundBox.y = ui::BOX_SOUND_Y; soundBox.size = ui::BOX_SZ; soundBox.label = "SOUND";
    smoothBox = {}; smoothBox.x = ui::BOX_X; smoothBox.y = ui::BOX_SMOOTH_Y; smoothBox.size = ui::BOX_SZ; smoothBox.label = "SMOOTH MENU";
    sync_widgets();
}

static Action cancel(LEDGrid &grid) {
    settings = entrySnapshot;
    apply_to(grid);
    sound::set_enabled(settings.sound);
    return Action::Cancel;
}

Action update(const InputState &in, LEDGrid &grid) {
    activeGrid = &grid;
    Action result = Action::None;
    bool consumed = false;

    if (in.selectPressed) {
        result = cancel(grid);
    } else {
        // Open list first so it wins over what sits beneath it
        UIDropdown* first = screenDD.open ? &screenDD : &styleDD;
        UIDropdown* second = first == &styleDD ? &screenDD : &styleDD;
        UIDropdown* hit = first;
        UIDropdownEvent ev = ui_dropdown_update(*first, in, consumed);
        if (!consumed) { hit = second; ev = ui_dropdown_update(*second, in, consumed); }
        if (ev == UIDropdownEvent::SelectionChanged) {
            char buf[64];
            snprintf(buf, sizeof buf, "options: %s %s\n", hit == &styleDD ? "style" : "screen",
                     (*hit->items)[hit->selectedIndex].c_str());
            hw_log(buf);
            sound::play_beep(660, 40);
        } else if (consumed) {
            sound::play_beep(440, 20);
        }

        if (!consumed && in.touchPressed) {
            const int x = in.stylusX, y = in.stylusY;
            if (soundBox.contains(x, y)) {
                settings.sound = !settings.sound;
                sound::set_enabled(settings.sound);
                if (settings.sound) sound::play_beep(880, 60);
            } else if (smoothBox.contains(x, y)) {
                settings.smoothCarousel = !settings.smoothCarousel;
                sound::play_beep(660, 40);
            } else {
                int hit = ui_hit_button(buttons.data(), (int)buttons.size(), x, y);
                if (hit >= 0) {
                    sound::play_beep(520, 25);
                    const char* label = buttons[hit].label;
                    if (strcmp(label, "CANCEL") == 0) result = cancel(grid);
                    else if (strcmp(label, "SAVE") == 0) {
                        if (!save_settings(default_path())) hw_log("options: save failed\n");
                        result = Action::SaveAndExit;
                    } else buttons[hit].trigger();
                }
            }
        }
    }
    sync_widgets();
    activeGrid = nullptr;
    return result;
}

#ifdef PLATFORM_3DS
static void draw_row(int y, const char* label, int value) {
    char buf[16]; snprintf(buf, sizeof buf, "%d", value);
    hw_draw_text(ui::LABEL_X, y + ui::STEP_H/2 - 3, label, 0xFFFFFFFF);
    hw_draw_text(ui::VALUE_X, y + ui::STEP_H/2 - 3, buf, 0xFFFF80FF);
}

void render() {
    C2D_DrawRectSolid(0, 0, 0, layout::BOTTOM_SCREEN_W, layout::BOTTOM_SCREEN_H, C2D_Color32(20,20,40,255));
    const char* title = "OPTIONS";
    hw_draw_text((layout::BOTTOM_SCREEN_W - hw_text_width(title)) / 2, 12, title, 0xFFFFFFFF);

    draw_row(ui::ROW_SIZE, "LED SIZE", settings.ledSize);
    draw_row(ui::ROW_SPACING, "LED SPACING", settings.ledSpacing);
    draw_row(ui::ROW_GAP, "LED GAP", settings.ledGap);
    hw_draw_text(ui::LABEL_X, ui::DD_STYLE_Y + ui::DD_H/2 - 3, "LED STYLE", 0xFFFFFFFF);
    hw_draw_text(ui::LABEL_X, ui::DD_SCREEN_Y + ui::DD_H/2 - 3, "GRID SCREEN", 0xFFFFFFFF);

    for (const auto &b : buttons) ui_draw_button(b, false);
    ui_draw_checkbox(soundBox);
    ui_draw_checkbox(smoothBox);

    // The open list overlays everything below it
    if (styleDD.open) { ui_dropdown_render(screenDD); ui_dropdown_render(styleDD); }
    else { ui_dropdown_render(styleDD); ui_dropdown_render(screenDD); }
}
#endif

} // namespace options
