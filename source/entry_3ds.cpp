// entry_3ds.cpp - main loop: poll, update, draw the grid and help on the two screens
#include <3ds.h>
#include <algorithm>
#include "hardware.hpp"
#include "game.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

int main(int argc, char** argv) {
    if(!hw_init()) return -1;
    if(!sound::init()) hw_log("sound unavailable\n");
    game_init();
    bool showTopLogs=false;
    bool showBottomLogs=false;
    u64 last = osGetTime();

    while (aptMainLoop()) {
        InputState in; hw_poll_input(in);
        u64 now = osGetTime();
        float dt = std::min(0.1f, (now - last) / 1000.0f);
        last = now;

        // Toggle log overlays: exact combo L+R+Up or L+R+Down (edge on Up/Down).
        if(in.lHeld && in.rHeld && (in.upPressed || in.downPressed)) {
            if(in.upPressed) showTopLogs = !showTopLogs;
            if(in.downPressed) showBottomLogs = !showBottomLogs;
        } else {
            game_update(in, dt);
        }
        sound::update();
        if(exit_requested()) break;

        game_render();
        const bool onTop = game_grid_on_top();
        const LEDGrid& grid = game_grid();

        hw_begin_frame();
        hw_set_top();
        if(onTop) hw_render_grid(grid);
        else hw_draw_text(8, 8, game_help_text(), 0xFFFFFFFF);
        if(showTopLogs) hw_draw_logs(4, 40, 200);

        hw_set_bottom();
        if(!onTop) {
            hw_render_grid(grid);
        } else if(game_state() == GameState::Options) {
            game_render_options();
        } else if(game_state() == GameState::Menu) {
            game_render_title_buttons(in);
            hw_draw_text(8, 220, game_help_text(), 0xC8C8C8FF);
        } else {
            hw_draw_text(8, 8, game_help_text(), 0xFFFFFFFF);
        }
        if(showBottomLogs) hw_draw_logs(4, 150, 86);
        hw_end_frame();
    }
    sound::shutdown();
    hw_shutdown();
    return 0;
}
