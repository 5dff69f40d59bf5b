// ui_button.cpp - hit testing and drawing for buttons and checkboxes
#ifdef PLATFORM_3DS
#include <citro2d.h>
#endif
#include "hardware.hpp"
#include "ui_button.hpp"

int ui_hit_button(const UIButton* buttons, int count, int px, int py) {
    for (int i = 0; i < count; ++i)
        if (buttons[i].enabled && buttons[i].contains(px, py)) return i;
    return -1;
}

#ifdef PLATFORM_3DS
uint32_t ui_to_c2d(uint32_t rgba) {
    return C2D_Color32((rgba>>24)&0xFF, (rgba>>16)&0xFF, (rgba>>8)&0xFF, rgba&0xFF);
}

void ui_draw_button(const UIButton &btn, bool pressed) {
    uint32_t base = btn.color ? btn.color : ui_rgba(50,50,80);
    uint8_t r = base>>24, g=base>>16, b=base>>8, a=base & 0xFF;
    if (!btn.enabled) {
        // Desaturate and dim when disabled
        uint8_t gray = (uint8_t)((r*30 + g*59 + b*11) / 100);
        r = g = b = gray;
        a = (uint8_t)(a * 0.6f);
    } else if (pressed) {
        r = (uint8_t)(r*0.7f); g=(uint8_t)(g*0.7f); b=(uint8_t)(b*0.7f);
    }
    C2D_DrawRectSolid(btn.x, btn.y, 0, btn.w, btn.h, C2D_Color32(r,g,b,a));
    if (btn.label) {
        int tx = btn.x + (btn.w - hw_text_width(btn.label)) / 2;
        hw_draw_text(tx, btn.y + (btn.h/2 - 3), btn.label, btn.enabled ? 0xFFFFFFFF : 0xDCDCDCC8);
    }
    uint32_t topL = btn.highlighted ? C2D_Color32(255,255,255,160) : C2D_Color32(255,255,255,40);
    uint32_t botR = C2D_Color32(0,0,0,120);
    C2D_DrawRectSolid(btn.x, btn.y, 0, btn.w, 1, topL);
    C2D_DrawRectSolid(btn.x, btn.y+btn.h-1, 0, btn.w, 1, botR);
    C2D_DrawRectSolid(btn.x, btn.y, 0, 1, btn.h, topL);
    C2D_DrawRectSolid(btn.x+btn.w-1, btn.y, 0, 1, btn.h, botR);
}

void ui_draw_checkbox(const UICheckbox &box) {
    if (box.label) hw_draw_text(box.x - hw_text_width(box.label) - 8, box.y + box.size/2 - 3, box.label, 0xFFFFFFFF);
    uint32_t edge = C2D_Color32(80,80,110,255);
    C2D_DrawRectSolid(box.x-1, box.y-1, 0, box.size+2, 1, edge);
    C2D_DrawRectSolid(box.x-1, box.y+box.size, 0, box.size+2, 1, edge);
    C2D_DrawRectSolid(box.x-1, box.y-1, 0, 1, box.size+2, edge);
    C2D_DrawRectSolid(box.x+box.size, box.y-1, 0, 1, box.size+2, edge);
    if (box.checked) C2D_DrawRectSolid(box.x+3, box.y+3, 0, box.size-6, box.size-6, C2D_Color32(200,200,255,255));
}
#endif
