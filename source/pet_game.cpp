// pet_game.cpp - stat decay, care actions and pet art
#include <algorithm>
#include <cmath>
#include "pet_game.hpp"
#include "led_grid.hpp"
#include "sound.hpp"

static float clamp_stat(float v) { return std::max(0.0f, std::min(10.0f, v)); }

PetGame::PetGame(LEDGrid &grid) : Game(grid) {
    pets[0].name = "DOG";  pets[0].primary = Color(210, 150, 90); pets[0].accent = Color(255, 255, 255);
    pets[1].name = "CAT";  pets[1].primary = Color(180, 180, 180); pets[1].accent = Color(255, 120, 180);
    pets[2].name = "DINO"; pets[2].primary = Color(60, 200, 90);  pets[2].accent = Color(255, 240, 120);
}

void PetGame::update(float dt) {
    PetState &pet = selected();
    pet.hunger = clamp_stat(pet.hunger - kHungerDecay * dt);
    pet.happiness = clamp_stat(pet.happiness - kHappinessDecay * dt);
    pet.energy = clamp_stat(pet.energy - kEnergyDecay * dt);

    if (action_timer > 0.0f) {
        action_timer = std::max(0.0f, action_timer - dt);
        if (action_timer == 0.0f) action_message.clear();
    }
}

void PetGame::feed() {
    PetState &pet = selected();
    pet.hunger = clamp_stat(pet.hunger + 3.0f);
    pet.energy = clamp_stat(pet.energy + 0.5f);
    pet.happiness = clamp_stat(pet.happiness - 0.3f);
    sound::play_beep(660, 60);
    flash_message("FED");
}

void PetGame::play() {
    PetState &pet = selected();
    pet.happiness = clamp_stat(pet.happiness + 3.0f);
    pet.energy = clamp_stat(pet.energy - 1.2f);
    pet.hunger = clamp_stat(pet.hunger - 0.8f);
    sound::play_beep(740, 60);
    flash_message("PLAY");
}

void PetGame::rest() {
    PetState &pet = selected();
    pet.energy = clamp_stat(pet.energy + 3.0f);
    pet.happiness = clamp_stat(pet.happiness + 0.4f);
    pet.hunger = clamp_stat(pet.hunger - 0.5f);
    sound::play_beep(520, 60);
    flash_message("REST");
}

void PetGame::flash_message(const char *msg) {
    action_message = msg;
    action_timer = kMessageTime;
}

void PetGame::render() {
    grid_.clear(Color(0, 0, 10));
    const PetState &pet = pets[selected_index];

    grid_.render_text("PETS", 2, 0, Color(120, 200, 255));
    grid_.render_text(pet.name, 2, 6, Color(0, 255, 255));

    switch (selected_index) {
        case 0: render_dog(4, 8, pet.primary, pet.accent); break;
        case 1: render_cat(4, 8, pet.primary, pet.accent); break;
        default: render_dino(4, 8, pet.primary, pet.accent); break;
    }

    const int statsY = 18;
    const Color hungerC{255, 180, 0}, happyC{255, 80, 180}, energyC{80, 160, 255};
    render_stat_bar(1, statsY, (int)std::lround(pet.hunger), hungerC);
    render_stat_bar(7, statsY, (int)std::lround(pet.happiness), happyC);
    render_stat_bar(13, statsY, (int)std::lround(pet.energy), energyC);
    grid_.set_pixel(1, statsY - 1, hungerC);
    grid_.set_pixel(7, statsY - 1, happyC);
    grid_.set_pixel(13, statsY - 1, energyC);

    if (!action_message.empty()) grid_.render_text(action_message, 1, 1, Color(255, 255, 0));

    const Color arrow{120, 120, 120};
    draw_left_arrow(grid_, 1, 10, arrow);
    draw_right_arrow(grid_, 17, 10, arrow);
}

// 0..10 shown on 5 pixels over a dim background.
void PetGame::render_stat_bar(int x, int y, int value, const Color &c) {
    value = std::max(0, std::min(10, value));
    int filled = (int)std::lround(value / 2.0);
    const Color dim(std::max(10, c.r / 5), std::max(10, c.g / 5), std::max(10, c.b / 5));
    for (int i = 0; i < 5; ++i) grid_.set_pixel(x + i, y, dim);
    for (int i = 0; i < filled; ++i) grid_.set_pixel(x + i, y, c);
}

void PetGame::render_dog(int x, int y, const Color &c, const Color &a) {
    grid_.set_pixel(x, y, c);
    grid_.set_pixel(x + 1, y + 1, c);
    grid_.set_pixel(x + 8, y, c);
    grid_.set_pixel(x + 7, y + 1, c);
    for (int dx = 2; dx < 7; ++dx) grid_.set_pixel(x + dx, y + 1, c);
    for (int dx = 1; dx < 8; ++dx) {
        grid_.set_pixel(x + dx, y + 2, c);
        grid_.set_pixel(x + dx, y + 3, c);
    }
    grid_.set_pixel(x + 3, y + 2, colors::Black);
    grid_.set_pixel(x + 6, y + 2, colors::Black);
    grid_.fill_rect(x + 4, y + 4, 2, 2, a);
    grid_.set_pixel(x + 4, y + 4, Color(40, 40, 40)); // nose
}

void PetGame::render_cat(int x, int y, const Color &c, const Color &a) {
    grid_.set_pixel(x + 2, y, c);
    grid_.set_pixel(x + 6, y, c);
    grid_.set_pixel(x + 1, y + 1, c);
    grid_.set_pixel(x + 7, y + 1, c);
    for (int dx = 2; dx < 7; ++dx) grid_.set_pixel(x + dx, y + 1, c);
    for (int dx = 1; dx < 8; ++dx) {
        grid_.set_pixel(x + dx, y + 2, c);
        grid_.set_pixel(x + dx, y + 3, c);
    }
    grid_.set_pixel(x + 3, y + 2, colors::Black);
    grid_.set_pixel(x + 5, y + 2, colors::Black);
    grid_.set_pixel(x + 4, y + 3, a);
    // whiskers
    grid_.set_pixel(x, y + 3, a);
    grid_.set_pixel(x + 1, y + 3, a);
    grid_.set_pixel(x + 7, y + 3, a);
    grid_.set_pixel(x + 8, y + 3, a);
}

void PetGame::render_dino(int x, int y, const Color &c, const Color &a) {
    grid_.set_pixel(x + 2, y, a);
    grid_.set_pixel(x + 3, y + 1, a);
    grid_.set_pixel(x + 4, y, a);
    for (int dx = 2; dx < 7; ++dx) grid_.set_pixel(x + dx, y + 2, c);
    for (int dx = 1; dx < 7; ++dx) grid_.set_pixel(x + dx, y + 3, c);
    grid_.set_pixel(x + 5, y + 2, colors::Black);
    for (int dx = 2; dx < 9; ++dx) grid_.set_pixel(x + dx, y + 4, c);
    for (int dx = 3; dx < 8; ++dx) grid_.set_pixel(x + dx, y + 5, c);
    grid_.set_pixel(x + 9, y + 4, c);
    grid_.set_pixel(x + 4, y + 6, c);
    grid_.set_pixel(x + 6, y + 6, c);
}

void PetGame::handle_input(const InputState &in) {
    if (in.selectPressed) { running_ = false; return; }
    const int count = (int)pets.size();
    if (in.leftPressed) {
        sound::play_beep(420, 35);
        selected_index = (selected_index + count - 1) % count;
    } else if (in.rightPressed) {
        sound::play_beep(520, 35);
        selected_index = (selected_index + 1) % count;
    } else if (in.aPressed) feed();
    else if (in.xPressed) play();
    else if (in.yPressed) rest();
}
