// hardware_3ds.cpp - citro2d platform layer: screens, input, debug font and the LED panel
#include "hardware.hpp"
#ifdef PLATFORM_3DS
#include <3ds.h>
#include <citro2d.h>
#include <stdio.h>
#include <string.h>
#include <algorithm>
#include "led_grid.hpp"
#include "layout.hpp"

namespace {
    C3D_RenderTarget* g_bottom = nullptr;
    C3D_RenderTarget* g_top = nullptr;
    int g_targetW = layout::TOP_SCREEN_W; // width of the target last selected

    // 5x6 pixel bitmap font (uppercase + digits + some punctuation)
    // Each row uses low 5 bits of a byte.
    struct Glyph5x6 { char c; uint8_t rows[6]; };
    static const Glyph5x6 kGlyphs[] = {
        {'A',{0x0E,0x11,0x1F,0x11,0x11,0x00}}, {'B',{0x1E,0x11,0x1E,0x11,0x1E,0x00}},
        {'C',{0x0E,0x11,0x10,0x11,0x0E,0x00}}, {'D',{0x1E,0x11,0x11,0x11,0x1E,0x00}},
        {'E',{0x1F,0x10,0x1E,0x10,0x1F,0x00}}, {'F',{0x1F,0x10,0x1E,0x10,0x10,0x00}},
        {'G',{0x0F,0x10,0x13,0x11,0x0F,0x00}}, {'H',{0x11,0x11,0x1F,0x11,0x11,0x00}},
        {'I',{0x1F,0x04,0x04,0x04,0x1F,0x00}}, {'J',{0x01,0x01,0x01,0x11,0x0E,0x00}},
        {'K',{0x11,0x12,0x1C,0x12,0x11,0x00}}, {'L',{0x10,0x10,0x10,0x10,0x1F,0x00}},
        {'M',{0x11,0x1B,0x15,0x11,0x11,0x00}}, {'N',{0x11,0x19,0x15,0x13,0x11,0x00}},
        {'O',{0x0E,0x11,0x11,0x11,0x0E,0x00}}, {'P',{0x1E,0x11,0x1E,0x10,0x10,0x00}},
        {'Q',{0x0E,0x11,0x11,0x15,0x0E,0x01}}, {'R',{0x1E,0x11,0x1E,0x12,0x11,0x00}},
        {'S',{0x0F,0x10,0x0E,0x01,0x1E,0x00}}, {'T',{0x1F,0x04,0x04,0x04,0x04,0x00}},
        {'U',{0x11,0x11,0x11,0x11,0x0E,0x00}}, {'V',{0x11,0x11,0x11,0x0A,0x04,0x00}},
        {'W',{0x11,0x11,0x15,0x1B,0x11,0x00}}, {'X',{0x11,0x0A,0x04,0x0A,0x11,0x00}},
        {'Y',{0x11,0x0A,0x04,0x04,0x04,0x00}}, {'Z',{0x1F,0x02,0x04,0x08,0x1F,0x00}},
        {'0',{0x0E,0x13,0x15,0x19,0x0E,0x00}}, {'1',{0x04,0x0C,0x04,0x04,0x0E,0x00}},
        {'2',{0x0E,0x11,0x02,0x04,0x1F,0x00}}, {'3',{0x1F,0x02,0x04,0x02,0x1F,0x00}},
        {'4',{0x02,0x06,0x0A,0x1F,0x02,0x00}}, {'5',{0x1F,0x10,0x1E,0x01,0x1E,0x00}},
        {'6',{0x06,0x08,0x1E,0x11,0x0E,0x00}}, {'7',{0x1F,0x01,0x02,0x04,0x08,0x00}},
        {'8',{0x0E,0x11,0x0E,0x11,0x0E,0x00}}, {'9',{0x0E,0x11,0x0F,0x01,0x06,0x00}},
        {':',{0x00,0x04,0x00,0x04,0x00,0x00}}, {'.',{0x00,0x00,0x00,0x00,0x04,0x00}},
        {'-',{0x00,0x00,0x0E,0x00,0x00,0x00}}, {'_',{0x00,0x00,0x00,0x00,0x1F,0x00}},
        {'/',{0x01,0x02,0x04,0x08,0x10,0x00}}, {'+',{0x00,0x04,0x0E,0x04,0x00,0x00}},
        {'<',{0x02,0x04,0x08,0x04,0x02,0x00}}, {'>',{0x08,0x04,0x02,0x04,0x08,0x00}},
        {'(',{0x02,0x04,0x04,0x04,0x02,0x00}}, {')',{0x08,0x04,0x04,0x04,0x08,0x00}},
        {' ',{0x00,0x00,0x00,0x00,0x00,0x00}},
    };

    const Glyph5x6* findGlyph(char c) {
        if(c>='a' && c<='z') c = (char)(c - 'a' + 'A');
        for(const auto &g : kGlyphs) if(g.c==c) return &g;
        return &kGlyphs[sizeof(kGlyphs)/sizeof(kGlyphs[0]) - 1]; // space fallback
    }

    // Wraps to the next line at the edge of the current target.
    void drawGlyphString(int x,int y,const char* s, uint32_t rgba) {
        uint8_t r=(rgba>>24)&0xFF,g=(rgba>>16)&0xFF,b=(rgba>>8)&0xFF,a=rgba&0xFF;
        const u32 col = C2D_Color32(r,g,b,a);
        const int startX = x;
        for(const char* p=s; *p; ++p) {
            if(*p=='\n' || x > g_targetW-6) { x = startX; y += 8; if(*p=='\n') continue; }
            const Glyph5x6* gptr = findGlyph(*p);
            for(int ry=0; ry<6; ++ry) {
                uint8_t row = gptr->rows[ry];
                for(int rx=0; rx<5; ++rx) if(row & (1 << (4-rx)))
                    C2D_DrawRectSolid(x+rx, y+ry, 0, 1,1, col);
            }
            x += 6;
        }
    }

    u32 c32(const Color &c) { return C2D_Color32(c.r, c.g, c.b, 255); }
}

bool hw_init() {
    gfxInitDefault();
    hw_log("hw_init start\n");
    if (!C3D_Init(C3D_DEFAULT_CMDBUF_SIZE)) { hw_log("C3D_Init FAILED\n"); return false; }
    if (!C2D_Init(C2D_DEFAULT_MAX_OBJECTS)) { hw_log("C2D_Init FAILED\n"); return false; }
    C2D_Prepare();
    g_bottom = C2D_CreateScreenTarget(GFX_BOTTOM, GFX_LEFT);
    g_top = C2D_CreateScreenTarget(GFX_TOP, GFX_LEFT);
    if(!g_bottom || !g_top) { hw_log("screen targets FAILED\n"); return false; }
    return true;
}

void hw_shutdown() {
    // Screen targets are owned by citro2d
    C2D_Fini();
    C3D_Fini();
    gfxExit();
}

void hw_poll_input(InputState& out) {
    hidScanInput();
    u32 kHeld = hidKeysHeld();
    u32 kDown = hidKeysDown();
    touchPosition tp{};
    out.touching = (kHeld & KEY_TOUCH) != 0;
    out.touchPressed = (kDown & KEY_TOUCH) != 0;
    if(out.touching) { hidTouchRead(&tp); out.stylusX = tp.px; out.stylusY = tp.py; }
    else { out.stylusX = out.stylusY = -1; }
    out.upHeld = (kHeld & KEY_UP) != 0;       out.upPressed = (kDown & KEY_UP) != 0;
    out.downHeld = (kHeld & KEY_DOWN) != 0;   out.downPressed = (kDown & KEY_DOWN) != 0;
    out.leftHeld = (kHeld & KEY_LEFT) != 0;   out.leftPressed = (kDown & KEY_LEFT) != 0;
    out.rightHeld = (kHeld & KEY_RIGHT) != 0; out.rightPressed = (kDown & KEY_RIGHT) != 0;
    out.aHeld = (kHeld & KEY_A) != 0; out.aPressed = (kDown & KEY_A) != 0;
    out.bHeld = (kHeld & KEY_B) != 0; out.bPressed = (kDown & KEY_B) != 0;
    out.xHeld = (kHeld & KEY_X) != 0; out.xPressed = (kDown & KEY_X) != 0;
    out.yHeld = (kHeld & KEY_Y) != 0; out.yPressed = (kDown & KEY_Y) != 0;
    out.lHeld = (kHeld & KEY_L) != 0; out.lPressed = (kDown & KEY_L) != 0;
    out.rHeld = (kHeld & KEY_R) != 0; out.rPressed = (kDown & KEY_R) != 0;
    out.startPressed = (kDown & KEY_START) != 0;
    out.selectPressed = (kDown & KEY_SELECT) != 0;
}

void hw_begin_frame() {
    C3D_FrameBegin(C3D_FRAME_SYNCDRAW);
    C2D_TargetClear(g_top, C2D_Color32(0,0,0,255));
    C2D_TargetClear(g_bottom, C2D_Color32(0,0,0,255));
}
void hw_end_frame() { C3D_FrameEnd(0); }

void hw_draw_text(int x,int y,const char* text, uint32_t rgba) { drawGlyphString(x,y,text,rgba); }

int hw_text_width(const char* text) { return text ? (int)strlen(text) * 6 : 0; }

void hw_draw_logs(int x,int y,int maxPixelsY) {
    // Render logs onto whichever target is current (caller sets scene)
    const std::vector<std::string>& logs = hw_log_lines();
    const int lineH=7; int maxLines = maxPixelsY / lineH; if(maxLines<=0) return;
    int start = (int)logs.size() - maxLines; if(start<0) start=0; int yy=y;
    for(size_t i=start;i<logs.size();++i) {
        int xx=x;
        for(char c : logs[i]) {
            const Glyph5x6* g = findGlyph(c);
            for(int ry=0; ry<6; ++ry) {
                uint8_t row = g->rows[ry];
                for(int rx=0; rx<5; ++rx) if(row & (1<<(4-rx))) C2D_DrawRectSolid(xx+rx, yy+ry, 0,1,1,C2D_Color32(180,180,180,255));
            }
            xx += 6; if(xx > g_targetW-6) break;
        }
        yy += lineH; if(yy + lineH > y + maxPixelsY) break;
    }
}

void hw_render_grid(const LEDGrid& grid) {
    const int size = grid.led_size();
    const int gap = grid.led_gap();
    const int radius = (size - gap * 2) / 2;
    for(int y=0; y<LEDGrid::kSize; ++y) {
        for(int x=0; x<LEDGrid::kSize; ++x) {
            const Color c = grid.get_pixel(x, y);
            const int lx = grid.led_origin_x(x), ly = grid.led_origin_y(y);
            // Unlit LEDs stay faintly visible
            Color dim(std::max(5, c.r / 10), std::max(5, c.g / 10), std::max(5, c.b / 10));
            if(grid.circular()) {
                float cx = lx + size / 2, cy = ly + size / 2;
                C2D_DrawCircleSolid(cx, cy, 0, radius + 1, c32(dim));
                if(c.is_black()) continue;
                C2D_DrawCircleSolid(cx, cy, 0, radius + 2, c32(Color(c.r / 3, c.g / 3, c.b / 3)));
                C2D_DrawCircleSolid(cx, cy, 0, radius, c32(c));
                Color hi(c.r + 80, c.g + 80, c.b + 80);
                C2D_DrawCircleSolid(cx - radius / 3, cy - radius / 3, 0, std::max(1, radius / 3), c32(hi));
            } else {
                C2D_DrawRectSolid(lx, ly, 0, size, size, c32(dim));
                if(c.is_black()) continue;
                C2D_DrawRectSolid(lx + gap, ly + gap, 0, size - gap * 2, size - gap * 2, c32(c));
            }
        }
    }
}

bool hw_prompt_char(const char* hint, char& out) {
    SwkbdState swkbd;
    char text[4] = {0};
    swkbdInit(&swkbd, SWKBD_TYPE_QWERTY, 2, 1);
    swkbdSetValidation(&swkbd, SWKBD_NOTEMPTY_NOTBLANK, 0, 0);
    swkbdSetHintText(&swkbd, hint);
    if(swkbdInputText(&swkbd, text, sizeof text) != SWKBD_BUTTON_CONFIRM || !text[0]) return false;
    out = text[0];
    return true;
}

void hw_set_top() {
    if(g_top) { C2D_SceneBegin(g_top); g_targetW = layout::TOP_SCREEN_W; }
}
void hw_set_bottom() {
    if(g_bottom) { C2D_SceneBegin(g_bottom); g_targetW = layout::BOTTOM_SCREEN_W; }
}

#endif // PLATFORM_3DS
