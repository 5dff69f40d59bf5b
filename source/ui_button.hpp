// ui_button.hpp - touch button and checkbox primitives for the bottom screen
#pragma once
#include <functional>
#include <cstdint>

// Colours are packed 0xRRGGBBAA, the same as hw_draw_text.
constexpr uint32_t ui_rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
    return ((uint32_t)r << 24) | ((uint32_t)g << 16) | ((uint32_t)b << 8) | a;
}

struct UIButton {
    int x=0,y=0,w=0,h=0;          // rectangle in bottom screen coordinates
    const char* label=nullptr;    // optional static label
    uint32_t color = 0;           // base fill colour (0xRRGGBBAA)
    std::function<void()> onTap;  // invoked on touchPressed inside rect
    bool highlighted=false;       // drawn with a light outline
    bool enabled=true;            // disabled buttons draw dim and ignore taps

    bool contains(int px,int py) const { return px>=x && px<x+w && py>=y && py<y+h; }
    void trigger() { if(enabled && onTap) onTap(); }
};

// Square toggle with a label on its left.
struct UICheckbox {
    int x=0,y=0,size=14;
    const char* label=nullptr;
    bool checked=false;

    bool contains(int px,int py) const { return px>=x && px<x+size && py>=y && py<y+size; }
};

// Returns the index of the first enabled button under the touch, or -1.
int ui_hit_button(const UIButton* buttons, int count, int px, int py);

#ifdef PLATFORM_3DS
uint32_t ui_to_c2d(uint32_t rgba);
void ui_draw_button(const UIButton &btn, bool pressed=false);
void ui_draw_checkbox(const UICheckbox &box);
#endif
