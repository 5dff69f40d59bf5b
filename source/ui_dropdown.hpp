// ui_dropdown.hpp - touch dropdown used by the options screen
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "hardware.hpp"

// Short fixed lists only: the open list shows every item below the header.
struct UIDropdown {
    int x=0,y=0,w=0,h=0;              // header rect
    int itemHeight=16;                // per-item height
    bool open=false;                  // is list expanded
    int selectedIndex=0;              // index into items
    const std::vector<std::string>* items=nullptr; // external items (must remain valid)
    uint32_t headerColor = 0;         // colours, 0xRRGGBBAA
    uint32_t arrowColor = 0;
    uint32_t itemColor = 0;
    uint32_t itemSelColor = 0;
    // Called after the user picks an item
    void (*onSelect)(int idx) = nullptr;

    int item_count() const { return items ? (int)items->size() : 0; }
    bool header_contains(int px,int py) const { return px>=x && px<x+w && py>=y && py<y+h; }
    // Item under (px,py) in the open list, or -1.
    int item_at(int px,int py) const;
};

enum class UIDropdownEvent { None, SelectionChanged };

inline void ui_dropdown_set_items(UIDropdown &dd, const std::vector<std::string> &items) { dd.items = &items; }

// Handle a touchPressed edge. touchConsumed is set when the dropdown used the tap,
// including a tap outside an open list (which closes it).
UIDropdownEvent ui_dropdown_update(UIDropdown &dd, const InputState &in, bool &touchConsumed);

#ifdef PLATFORM_3DS
// Draw header and, when open, the list overlay.
void ui_dropdown_render(const UIDropdown &dd);
#endif
