// pet_game.hpp - three tiny virtual pets with decaying needs
#pragma once
#include <array>
#include <string>
#include "game.hpp"

struct PetState {
    std::string name;
    Color primary;
    Color accent;
    float hunger = 7.0f;
    float happiness = 7.0f;
    float energy = 7.0f;
};

class PetGame : public Game {
public:
    explicit PetGame(LEDGrid &grid);

    void update(float dt) override;
    void render() override;
    void handle_input(const InputState &in) override;
    const char* help() const override { return "LR Pet  A Feed  X Play  Y Rest  SELECT Menu"; }

    void feed();
    void play();
    void rest();
    PetState &selected() { return pets[selected_index]; }

    static constexpr float kHungerDecay = 0.30f;    // per second
    static constexpr float kHappinessDecay = 0.18f;
    static constexpr float kEnergyDecay = 0.22f;
    static constexpr float kMessageTime = 0.8f;

    std::array<PetState, 3> pets;
    int selected_index = 0;
    std::string action_message;
    float action_timer = 0.0f;

private:
    void flash_message(const char *msg);
    void render_stat_bar(int x, int y, int value, const Color &c);
    void render_dog(int x, int y, const Color &c, const Color &a);
    void render_cat(int x, int y, const Color &c, const Color &a);
    void render_dino(int x, int y, const Color &c, const Color &a);
};
