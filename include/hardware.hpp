// hardware.hpp - platform abstraction: input snapshot, logging and (on 3DS) citro2d drawing
#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One frame of controller state. *Held are levels, *Pressed are edges (became down this frame).
struct InputState {
	int  stylusX = -1;
	int  stylusY = -1;
	bool touching = false;
	bool touchPressed = false; // edge: became touching this frame
	bool upHeld = false, downHeld = false, leftHeld = false, rightHeld = false;
	bool upPressed = false, downPressed = false, leftPressed = false, rightPressed = false;
	bool aHeld = false, bHeld = false, xHeld = false, yHeld = false;
	bool aPressed = false, bPressed = false, xPressed = false, yPressed = false;
	bool lHeld = false, rHeld = false;
	bool lPressed = false, rPressed = false;
	bool startPressed = false; // START key (edge)
	bool selectPressed = false; // SELECT key (edge)
};

// Log a message (may contain several lines). Lines go to a 64-line ring buffer,
// immediate repeats are coalesced as " (xN)", and each line is echoed to stderr
// (and svcOutputDebugString on 3DS).
void hw_log(const char* msg);

// Current contents of the log ring buffer, oldest first.
const std::vector<std::string>& hw_log_lines();

#ifdef PLATFORM_3DS
// ---------------------------------------------------------------------------
// 3DS platform layer (citro2d, both screens)
// ---------------------------------------------------------------------------
#include <citro2d.h>

class LEDGrid;

bool hw_init();
void hw_shutdown();

// Input polling (buttons + stylus)
void hw_poll_input(InputState& out);

// Frame lifecycle
void hw_begin_frame();
void hw_end_frame();

// Switch current drawing target (top or bottom screen)
void hw_set_top();
void hw_set_bottom();

// Minimal 5x6 debug font rendering
void hw_draw_text(int x,int y,const char* text, uint32_t rgba = 0xC8C8C8FF);
int hw_text_width(const char* text);

// Draw recent log lines into current target starting at (x,y); maxPixelsY caps height (optional).
void hw_draw_logs(int x,int y,int maxPixelsY=240);

// Draw the LED panel into the current target using the grid's size/spacing/gap/style.
void hw_render_grid(const LEDGrid& grid);

// Software keyboard prompt for a single character. Returns false when cancelled.
bool hw_prompt_char(const char* hint, char& out);

#endif // PLATFORM_3DS
