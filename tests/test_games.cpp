// test_games.cpp - rules of the built-in games
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "led_grid.hpp"
#include "pong.hpp"
#include "snake.hpp"
#include "flappy.hpp"
#include "basketball.hpp"
#include "asphalt_race.hpp"
#include "pet_game.hpp"
#include "shadow_fight.hpp"
#include "vacation.hpp"
#include "boot_screen.hpp"

static constexpr int N = LEDGrid::kSize;

// Pong -----------------------------------------------------------------------

TEST(Pong, ModeSelectionStartsVsAi) {
    LEDGrid grid;
    Pong pong(grid);
    InputState in;
    in.rightPressed = true;
    pong.handle_input(in);
    EXPECT_EQ(pong.mode_index, 1);
    in = InputState();
    in.leftPressed = true;
    pong.handle_input(in);
    in = InputState();
    in.aPressed = true;
    pong.handle_input(in);
    EXPECT_TRUE(pong.mode_selected);
    EXPECT_FALSE(pong.two_player);
}

TEST(Pong, ServeSpeedIsConstant) {
    LEDGrid grid;
    Pong pong(grid);
    pong.seed(3);
    for (int i = 0; i < 20; ++i) {
        pong.reset_ball();
        float speed = std::sqrt(pong.ball_vx * pong.ball_vx + pong.ball_vy * pong.ball_vy);
        EXPECT_NEAR(speed, Pong::kBallSpeed, 1e-3);
        EXPECT_LE(std::fabs(pong.ball_vy), std::fabs(pong.ball_vx) + 1e-3f);
    }
}

TEST(Pong, MissScoresForOpponent) {
    LEDGrid grid;
    Pong pong(grid);
    pong.mode_selected = true;
    pong.started = true;
    pong.left_paddle_y = 0.0f;
    pong.ball_x = 0.1f;
    pong.ball_y = 9.0f;
    pong.ball_vx = -8.0f;
    pong.ball_vy = 0.0f;
    pong.update(0.05f);
    EXPECT_EQ(pong.right_score, 1);
    EXPECT_FALSE(pong.started);
    EXPECT_GT(pong.score_anim_timer, 0.0f);
}

TEST(Pong, PaddleReturnsBall) {
    LEDGrid grid;
    Pong pong(grid);
    pong.mode_selected = true;
    pong.started = true;
    pong.left_paddle_y = 7.0f;
    pong.ball_x = 1.5f;
    pong.ball_y = 9.0f;
    pong.ball_vx = -8.0f;
    pong.ball_vy = 0.0f;
    pong.update(0.01f);
    EXPECT_GT(pong.ball_vx, 0.0f);
    EXPECT_EQ(pong.left_score + pong.right_score, 0);
}

TEST(Pong, FifthPointEndsMatch) {
    LEDGrid grid;
    Pong pong(grid);
    pong.mode_selected = true;
    pong.started = true;
    pong.left_score = Pong::kMaxScore - 1;
    pong.right_paddle_y = 0.0f;
    pong.ball_x = N - 0.1f;
    pong.ball_y = 12.0f;
    pong.ball_vx = 8.0f;
    pong.ball_vy = 0.0f;
    pong.update(0.05f);
    EXPECT_TRUE(pong.game_over);
    EXPECT_EQ(pong.winner, Pong::Side::Left);
}

// Snake ----------------------------------------------------------------------

TEST(Snake, ReversalIgnored) {
    LEDGrid grid;
    Snake snake(grid);
    snake.set_next_dir({-1, 0});
    EXPECT_EQ(snake.next_direction, Snake::Pos(1, 0));
    snake.set_next_dir({0, 1});
    EXPECT_EQ(snake.next_direction, Snake::Pos(0, 1));
}

TEST(Snake, StepKeepsLengthWithoutFood) {
    LEDGrid grid;
    Snake snake(grid);
    snake.food = {0, N - 1};
    snake.step();
    EXPECT_EQ(snake.snake.size(), 3u);
    EXPECT_EQ(snake.snake.back(), Snake::Pos(N / 2 + 2, N / 2));
    EXPECT_FALSE(snake.game_over);
}

TEST(Snake, EatingGrows) {
    LEDGrid grid;
    Snake snake(grid);
    Snake::Pos head = snake.snake.back();
    snake.food = {head.first + 1, head.second};
    snake.step();
    EXPECT_EQ(snake.snake.size(), 4u);
    EXPECT_EQ(snake.score, 1);
}

TEST(Snake, FoodNeverOnBody) {
    LEDGrid grid;
    Snake snake(grid);
    snake.seed(42);
    snake.snake.clear();
    for (int x = 0; x < N; ++x)
        for (int y = 0; y < N - 1; ++y) snake.snake.emplace_back(x, y);
    for (int i = 0; i < 50; ++i) {
        snake.spawn_food();
        EXPECT_EQ(snake.food.second, N - 1);
    }
}

TEST(Snake, WallKills) {
    LEDGrid grid;
    Snake snake(grid);
    snake.snake.assign({{N - 3, 9}, {N - 2, 9}, {N - 1, 9}});
    snake.food = {0, 0};
    snake.step();
    EXPECT_TRUE(snake.game_over);
}

TEST(Snake, SelfCollisionKills) {
    LEDGrid grid;
    Snake snake(grid);
    // Head at (5,5) moving up into its own body
    snake.snake.assign({{6, 6}, {5, 6}, {4, 6}, {4, 5}, {4, 4}, {5, 4}, {6, 4}, {6, 5}, {5, 5}});
    snake.direction = snake.next_direction = {-1, 0};
    snake.food = {0, 0};
    snake.step();
    EXPECT_TRUE(snake.game_over);
}

TEST(Snake, MovingIntoTailIsAllowed) {
    LEDGrid grid;
    Snake snake(grid);
    snake.snake.assign({{5, 6}, {6, 6}, {6, 5}, {5, 5}});
    snake.direction = snake.next_direction = {0, 1};
    snake.food = {0, 0};
    snake.step();
    EXPECT_FALSE(snake.game_over);
}

// Flappy ---------------------------------------------------------------------

TEST(Flappy, PipeScoresOnce) {
    LEDGrid grid;
    Flappy f(grid);
    f.pipes = {Flappy::Pipe{5.2f, 9}};
    f.bird_y = 9.0f;
    f.bird_vy = 0.0f;
    f.update(0.05f);
    EXPECT_EQ(f.score, 1);
    f.update(0.01f);
    EXPECT_EQ(f.score, 1);
    EXPECT_FALSE(f.game_over);
}

TEST(Flappy, HittingPipeEndsRun) {
    LEDGrid grid;
    Flappy f(grid);
    f.pipes = {Flappy::Pipe{(float)Flappy::kBirdX, 15}};
    f.bird_y = 0.0f;
    f.bird_vy = 0.0f;
    f.update(0.0f);
    EXPECT_TRUE(f.game_over);
}

TEST(Flappy, LeavingScreenEndsRun) {
    LEDGrid grid;
    Flappy f(grid);
    f.bird_y = N - 0.5f;
    f.bird_vy = 5.0f;
    f.update(0.1f);
    EXPECT_TRUE(f.game_over);
}

TEST(Flappy, PipesRecycle) {
    LEDGrid grid;
    Flappy f(grid);
    f.pipes = {Flappy::Pipe{-1.9f, 9}, Flappy::Pipe{30.0f, 9}};
    f.bird_y = 9.0f;
    f.update(0.05f);
    EXPECT_EQ(f.pipes.size(), 2u);
    EXPECT_FLOAT_EQ(f.pipes.back().x, (float)(N + 2));
}

TEST(Flappy, FlapAndRestart) {
    LEDGrid grid;
    Flappy f(grid);
    InputState in;
    in.aPressed = true;
    f.handle_input(in);
    EXPECT_FLOAT_EQ(f.bird_vy, Flappy::kFlapVelocity);
    f.game_over = true;
    f.score = 4;
    in = InputState();
    in.bPressed = true;
    f.handle_input(in);
    EXPECT_FALSE(f.game_over);
    EXPECT_EQ(f.score, 0);
}

// Basketball -----------------------------------------------------------------

TEST(Basketball, CloserShotsAreLikelier) {
    LEDGrid grid;
    Basketball b(grid);
    b.players[2].x = 9.0f; b.players[2].y = 17.0f;
    b.players[3].x = 9.0f; b.players[3].y = 1.0f;
    b.players[0].x = 14.0f; b.players[0].y = 9.0f;
    float close = b.shot_probability(0, Basketball::kRightHoopX, Basketball::kHoopY);
    b.players[0].x = 3.0f; b.players[0].y = 3.0f;
    float far = b.shot_probability(0, Basketball::kRightHoopX, Basketball::kHoopY);
    EXPECT_GT(close, far);
    EXPECT_NEAR(close, 0.74f, 1e-4);
    EXPECT_GE(far, 0.05f);
}

TEST(Basketball, DefenderHalvesChance) {
    LEDGrid grid;
    Basketball b(grid);
    b.players[3].x = 9.0f; b.players[3].y = 1.0f;
    b.players[0].x = 14.0f; b.players[0].y = 9.0f;
    b.players[2].x = 14.5f; b.players[2].y = 9.0f;
    EXPECT_NEAR(b.shot_probability(0, Basketball::kRightHoopX, Basketball::kHoopY), 0.37f, 1e-4);
}

TEST(Basketball, ShotChanceFixedAtRelease) {
    LEDGrid grid;
    Basketball b(grid);
    b.players[0].x = 14.0f; b.players[0].y = 9.0f;
    float expected = b.shot_probability(0, Basketball::kRightHoopX, Basketball::kHoopY);
    b.shoot(0, Basketball::kRightHoopX, Basketball::kHoopY);
    b.players[0].x = 2.0f;
    EXPECT_FLOAT_EQ(b.shot_chance, expected);
    EXPECT_TRUE(b.ball_in_air);
    EXPECT_EQ(b.ball_holder, Basketball::kNoHolder);
}

TEST(Basketball, ConcedingTeamGetsBall) {
    LEDGrid grid;
    Basketball b(grid);
    b.scoring_team = 1;
    b.reset_positions();
    EXPECT_EQ(b.players[b.ball_holder].team, 2);
    b.scoring_team = 2;
    b.reset_positions();
    EXPECT_EQ(b.ball_holder, Basketball::kControlled);
}

TEST(Basketball, TeamsAndHoops) {
    LEDGrid grid;
    Basketball b(grid);
    EXPECT_EQ(b.teammate_of(0), 1);
    EXPECT_EQ(b.teammate_of(3), 2);
    EXPECT_EQ(b.hoop_x_for(1), (float)Basketball::kRightHoopX);
    EXPECT_EQ(b.hoop_x_for(2), (float)Basketball::kLeftHoopX);
}

// AsphaltRace ----------------------------------------------------------------

TEST(AsphaltRace, RoadWidensTowardsPlayer) {
    LEDGrid grid;
    AsphaltRace race(grid);
    int horizon = race.road_half_width(AsphaltRace::kHorizonY);
    int bottom = race.road_half_width(N - 1);
    EXPECT_LE(horizon, bottom);
    EXPECT_GE(horizon, 2);
    for (int y = AsphaltRace::kHorizonY; y < N - 1; ++y)
        EXPECT_LE(race.road_half_width(y), race.road_half_width(y + 1));
}

TEST(AsphaltRace, CollisionWithCarInLane) {
    LEDGrid grid;
    AsphaltRace race(grid);
    race.traffic = {AsphaltRace::Car{0.0f, (float)AsphaltRace::kPlayerY}};
    EXPECT_TRUE(race.check_collision());
    race.traffic = {AsphaltRace::Car{5.0f, (float)AsphaltRace::kPlayerY}};
    EXPECT_FALSE(race.check_collision());
    race.traffic = {AsphaltRace::Car{0.0f, 3.0f}};
    EXPECT_FALSE(race.check_collision());
}

TEST(AsphaltRace, TrafficSpawnsOnRoad) {
    LEDGrid grid;
    AsphaltRace race(grid);
    race.seed(7);
    int hw = race.road_half_width(AsphaltRace::kHorizonY + 1);
    for (int i = 0; i < 30; ++i) race.spawn_traffic();
    for (const auto &car : race.traffic) EXPECT_LT(std::fabs(car.x), (float)hw);
}

TEST(AsphaltRace, CrashStopsAndResets) {
    LEDGrid grid;
    AsphaltRace race(grid);
    race.traffic = {AsphaltRace::Car{0.0f, (float)AsphaltRace::kPlayerY}};
    race.update(1.0f / 60.0f);
    EXPECT_TRUE(race.crashed);
    float d = race.distance;
    race.update(1.0f);
    EXPECT_FLOAT_EQ(race.distance, d);
    race.reset();
    EXPECT_FALSE(race.crashed);
    EXPECT_TRUE(race.traffic.empty());
}

// PetGame --------------------------------------------------------------------

TEST(PetGame, OnlySelectedPetDecays) {
    LEDGrid grid;
    PetGame pets(grid);
    pets.update(1.0f);
    EXPECT_NEAR(pets.pets[0].hunger, 7.0f - PetGame::kHungerDecay, 1e-4);
    EXPECT_NEAR(pets.pets[0].happiness, 7.0f - PetGame::kHappinessDecay, 1e-4);
    EXPECT_NEAR(pets.pets[0].energy, 7.0f - PetGame::kEnergyDecay, 1e-4);
    EXPECT_FLOAT_EQ(pets.pets[1].hunger, 7.0f);
}

TEST(PetGame, StatsStayInRange) {
    LEDGrid grid;
    PetGame pets(grid);
    for (int i = 0; i < 50; ++i) { pets.feed(); pets.play(); pets.rest(); }
    const PetState &p = pets.pets[0];
    EXPECT_LE(p.hunger, 10.0f);
    EXPECT_LE(p.happiness, 10.0f);
    EXPECT_LE(p.energy, 10.0f);
    for (int i = 0; i < 50; ++i) pets.update(1.0f);
    EXPECT_GE(pets.pets[0].hunger, 0.0f);
    EXPECT_GE(pets.pets[0].happiness, 0.0f);
    EXPECT_GE(pets.pets[0].energy, 0.0f);
}

TEST(PetGame, SelectionWrapsAndMessageExpires) {
    LEDGrid grid;
    PetGame pets(grid);
    InputState in;
    in.leftPressed = true;
    pets.handle_input(in);
    EXPECT_EQ(pets.selected_index, 2);
    pets.feed();
    EXPECT_EQ(pets.action_message, "FED");
    pets.update(PetGame::kMessageTime + 0.1f);
    EXPECT_TRUE(pets.action_message.empty());
}

// ShadowFight ----------------------------------------------------------------

TEST(ShadowFight, PunchLandsOnlyInReach) {
    LEDGrid grid;
    ShadowFight fight(grid);
    fight.p1.x = 8.0f;
    fight.ai.x = 9.0f;
    fight.p1.attack_timer = ShadowFight::kPunchTime;
    fight.resolve_hits();
    EXPECT_EQ(fight.ai.hp, ShadowFight::kMaxHp - 1);

    fight.ai.x = 12.0f;
    fight.p1.attack_timer = ShadowFight::kPunchTime;
    fight.resolve_hits();
    EXPECT_EQ(fight.ai.hp, ShadowFight::kMaxHp - 1);
}

TEST(ShadowFight, EachPunchHitsOnce) {
    LEDGrid grid;
    ShadowFight fight(grid);
    fight.p1.x = 8.0f;
    fight.ai.x = 9.0f;
    fight.p1.attack_timer = ShadowFight::kPunchTime;
    fight.resolve_hits();
    fight.resolve_hits();
    EXPECT_EQ(fight.ai.hp, ShadowFight::kMaxHp - 1);
}

TEST(ShadowFight, KnockoutDecidesWinner) {
    LEDGrid grid;
    ShadowFight fight(grid);
    fight.ai.hp = 0;
    fight.update(0.0f);
    EXPECT_TRUE(fight.game_over);
    EXPECT_EQ(fight.winner, "YOU");
}

TEST(ShadowFight, GravityReturnsToGround) {
    LEDGrid grid;
    ShadowFight fight(grid);
    fight.p1.vy = ShadowFight::kJumpV;
    for (int i = 0; i < 120; ++i) fight.update(1.0f / 60.0f);
    EXPECT_FLOAT_EQ(fight.p1.y, (float)ShadowFight::kGroundY);
}

// VacationGallery / BootScreen ------------------------------------------------

TEST(Vacation, ScenesWrap) {
    LEDGrid grid;
    VacationGallery v(grid);
    InputState in;
    in.leftPressed = true;
    v.handle_input(in);
    EXPECT_EQ(v.scene_index, VacationGallery::kNumScenes - 1);
    in = InputState();
    in.aPressed = true;
    v.handle_input(in);
    EXPECT_FALSE(v.animate);
    in = InputState();
    in.selectPressed = true;
    v.handle_input(in);
    EXPECT_FALSE(v.is_running());
}

TEST(BootScreen, FinishesAfterDuration) {
    LEDGrid grid;
    BootScreen boot(grid);
    boot.update(BootScreen::kDuration * 0.5f);
    boot.render();
    EXPECT_TRUE(boot.is_running());
    boot.update(BootScreen::kDuration);
    EXPECT_FALSE(boot.is_running());
}

TEST(Games, RenderNeverLeavesGrid) {
    LEDGrid grid;
    Pong pong(grid); pong.render();
    Snake snake(grid); snake.render();
    Flappy flappy(grid); flappy.render();
    Basketball ball(grid); ball.render();
    AsphaltRace race(grid); race.render();
    PetGame pets(grid); pets.render();
    ShadowFight fight(grid); fight.render();
    VacationGallery vacay(grid); vacay.render();
    SUCCEED();
}
