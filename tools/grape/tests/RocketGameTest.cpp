#include <gtest/gtest.h>
#include "../RocketGame.hpp"

using namespace std::chrono_literals;

TEST(RocketGameTest, ArrowKeysNudgeVelocity) {
    grape::RocketGame game{sdlmodel::scenes::Sprite{nullptr, 50, 50}};
    EXPECT_TRUE(game.handleKey(SDLK_RIGHT));
    EXPECT_TRUE(game.handleKey(SDLK_RIGHT));
    EXPECT_TRUE(game.handleKey(SDLK_UP));
    EXPECT_FALSE(game.handleKey(SDLK_A));
    auto v = game.velocity();
    EXPECT_NEAR(v.x, 20, 1e-3);
    EXPECT_NEAR(v.y, -10, 1e-3);
}

TEST(RocketGameTest, MovesWithinBounds) {
    grape::RocketGame game{sdlmodel::scenes::Sprite{nullptr, 50, 50}};
    game.handleKey(SDLK_RIGHT);
    SDL_Rect bounds{0, 0, 100, 100};
    EXPECT_TRUE(game.step(0s, bounds));
    EXPECT_TRUE(game.step(1s, bounds));
    EXPECT_NEAR(game.center().x, 60, 1e-3);
    EXPECT_NEAR(game.velocity().x, 10, 1e-3);
}

TEST(RocketGameTest, BouncesOffRightWall) {
    grape::RocketGame game{sdlmodel::scenes::Sprite{nullptr, 95, 50}};
    game.handleKey(SDLK_RIGHT);
    SDL_Rect bounds{0, 0, 100, 100};
    game.step(0s, bounds);
    game.step(1s, bounds);
    EXPECT_GT(game.center().x, 100);
    EXPECT_NEAR(game.velocity().x, -10, 1e-3);

    // still outside but already heading back: no second reversal.
    game.step(1100ms, bounds);
    EXPECT_NEAR(game.velocity().x, -10, 1e-3);
}

TEST(RocketGameTest, BouncesOffTopWall) {
    grape::RocketGame game{sdlmodel::scenes::Sprite{nullptr, 50, 5}};
    game.handleKey(SDLK_UP);
    SDL_Rect bounds{0, 0, 100, 100};
    game.step(0s, bounds);
    game.step(1s, bounds);
    EXPECT_LT(game.center().y, 0);
    EXPECT_NEAR(game.velocity().y, 10, 1e-3);
}

TEST(RocketGameTest, StillRocketReportsNoChange) {
    grape::RocketGame game{sdlmodel::scenes::Sprite{nullptr, 50, 50}};
    SDL_Rect bounds{0, 0, 100, 100};
    EXPECT_TRUE(game.step(0s, bounds));
    EXPECT_FALSE(game.step(1s, bounds));
}

TEST(RocketGameTest, StatusText) {
    grape::RocketGame game{sdlmodel::scenes::Sprite{nullptr, 12, 34}};
    auto text = game.statusText();
    EXPECT_NE(text.find("x: 12"), std::string::npos);
    EXPECT_NE(text.find("y: 34"), std::string::npos);
}
