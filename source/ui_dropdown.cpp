// ui_dropdown.cpp - dropdown widget: touch handling and drawing
#ifdef PLATFORM_3DS
#include <citro2d.h>
#include "ui_button.hpp"
#endif
#include "ui_dropdown.hpp"

int UIDropdown::item_at(int px,int py) const {
    const int listY = y + h;
    if (!open || px < x || px >= x + w || py < listY) return -1;
    int idx = (py - listY) / itemHeight;
    return idx < item_count() ? idx : -1;
}

UIDropdownEvent ui_dropdown_update(UIDropdown &dd, const InputState &in, bool &touchConsumed) {
    touchConsumed = false;
    if (!in.touchPressed) return UIDropdownEvent::None;
    const int px = in.stylusX, py = in.stylusY;

    if (dd.header_contains(px, py)) {
        dd.open = !dd.open;
        touchConsumed = true;
        if (dd.selectedIndex >= dd.item_count()) dd.selectedIndex = dd.item_count() - 1;
        if (dd.selectedIndex < 0) dd.selectedIndex = 0;
        return UIDropdownEvent::None;
    }
    if (!dd.open) return UIDropdownEvent::None;

    // Any tap while open closes the list
    int idx = dd.item_at(px, py);
    dd.open = false;
    touchConsumed = true;
    if (idx < 0) return UIDropdownEvent::None;
    dd.selectedIndex = idx;
    if (dd.onSelect) dd.onSelect(idx);
    return UIDropdownEvent::SelectionChanged;
}

#ifdef PLATFORM_3DS
void ui_dropdown_render(const UIDropdown &dd) {
    C2D_DrawRectSolid(dd.x, dd.y, 0, dd.w, dd.h, ui_to_c2d(dd.headerColor));
    const char *label = dd.item_count() == 0 ? "(none)"
                      : (dd.selectedIndex >= 0 && dd.selectedIndex < dd.item_count() ? (*dd.items)[dd.selectedIndex].c_str() : "?");
    hw_draw_text(dd.x+8, dd.y + dd.h/2 - 3, label, 0xFFFFFFFF);

    // Arrow box with a 7-row triangle, pointing up while open
    int arrowW = dd.h + 3; if (arrowW < 14) arrowW = 14;
    int arrowX = dd.x + dd.w - arrowW;
    C2D_DrawRectSolid(arrowX, dd.y, 0, arrowW, dd.h, ui_to_c2d(dd.arrowColor));
    const int triH = 7, cx = arrowX + arrowW/2, midY = dd.y + dd.h/2;
    const uint32_t triCol = C2D_Color32(200,200,230,255);
    for (int row = 0; row < triH; ++row) {
        int span = 1 + row*2;
        int y = dd.open ? midY - triH/2 + row : midY + triH/2 - row;
        C2D_DrawRectSolid(cx - span/2, y, 0, span, 1, triCol);
    }

    if (!dd.open) return;
    const int listY = dd.y + dd.h;
    for (int i = 0; i < dd.item_count(); ++i) {
        int iy = listY + i*dd.itemHeight;
        uint32_t col = ui_to_c2d(i == dd.selectedIndex ? dd.itemSelColor : dd.itemColor);
        C2D_DrawRectSolid(dd.x, iy, 0, dd.w, dd.itemHeight, ui_to_c2d(dd.headerColor));
        C2D_DrawRectSolid(dd.x+2, iy+1, 0, dd.w-4, dd.itemHeight-2, col);
        hw_draw_text(dd.x+6, iy+dd.itemHeight/2 - 3, (*dd.items)[i].c_str(), 0xFFFFFFFF);
    }
}
#endif
