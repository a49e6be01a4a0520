#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "TestProps.hpp"

using namespace sdlmodel::scenes;
using namespace std::chrono_literals;

TEST(KinematicsTest, FirstUpdateOnlyRecordsTime) {
    Kinematics k{};
    k.centerX = 10;
    k.speed = 100;
    EXPECT_TRUE(k.update(5s));
    EXPECT_FLOAT_EQ(k.centerX, 10);
    EXPECT_FLOAT_EQ(k.centerY, 0);
    ASSERT_TRUE(k.lastUpdate.has_value());
    EXPECT_EQ(*k.lastUpdate, 5s);
}

TEST(KinematicsTest, UpdatesShorterThanTimeSliceAreSkipped) {
    Kinematics k{};
    k.speed = 100;
    k.update(0ms);
    EXPECT_FALSE(k.update(9ms));
    EXPECT_FLOAT_EQ(k.centerY, 0);
    EXPECT_EQ(*k.lastUpdate, 0ms);
    EXPECT_TRUE(k.update(10ms));
}

TEST(KinematicsTest, SkippedTimeCountsTowardsNextUpdate) {
    Kinematics k{};
    k.speed = 100;
    k.update(0ms);
    EXPECT_FALSE(k.update(9ms));
    EXPECT_TRUE(k.update(15ms));
    // integrated over 15ms from the last committed update, not 6ms.
    EXPECT_NEAR(k.centerY, -1.5, 1e-4);
    EXPECT_EQ(*k.lastUpdate, 15ms);
}

TEST(KinematicsTest, HeadingZeroMovesUp) {
    Kinematics k{};
    k.speed = 100;
    k.heading = 0;
    k.update(0s);
    EXPECT_TRUE(k.update(1s));
    EXPECT_NEAR(k.centerX, 0, 1e-3);
    EXPECT_NEAR(k.centerY, -100, 1e-3);
}

TEST(KinematicsTest, HeadingNinetyMovesRight) {
    Kinematics k{};
    k.speed = 50;
    k.heading = 90;
    k.update(0s);
    k.update(2s);
    EXPECT_NEAR(k.centerX, 100, 1e-3);
    EXPECT_NEAR(k.centerY, 0, 1e-3);
}

TEST(KinematicsTest, SpinRotatesAndWraps) {
    Kinematics k{};
    k.spin = 90;
    k.rotation = 300;
    k.update(0s);
    EXPECT_TRUE(k.update(1s));
    EXPECT_NEAR(k.rotation, 30, 1e-3);
}

TEST(KinematicsTest, StillObjectNeverChanges) {
    Kinematics k{};
    k.centerX = 3;
    k.centerY = 4;
    k.update(0s);
    EXPECT_FALSE(k.update(1s));
    EXPECT_FALSE(k.update(2s));
    EXPECT_FLOAT_EQ(k.centerX, 3);
    EXPECT_FLOAT_EQ(k.centerY, 4);
}

TEST(KinematicsTest, VelocityConversions) {
    auto up = Kinematics::toVelocity(10, 0);
    EXPECT_FLOAT_EQ(up.x, 0);
    EXPECT_FLOAT_EQ(up.y, -10);

    auto down = Kinematics::toMotion(Velocity{0, 10});
    EXPECT_NEAR(down.speed, 10, 1e-4);
    EXPECT_NEAR(down.heading, 180, 1e-4);

    auto left = Kinematics::toMotion(Velocity{-10, 0});
    EXPECT_NEAR(left.heading, 270, 1e-4);

    auto none = Kinematics::toMotion(Velocity{0, 0});
    EXPECT_FLOAT_EQ(none.speed, 0);
    EXPECT_GE(none.heading, 0);
    EXPECT_LT(none.heading, 360);
}

TEST(KinematicsTest, VelocityRoundTrip) {
    const std::vector<Velocity> velocities{
        {30, -40}, {40, 30}, {-30, 40}, {-40, -30}, {0, 25}, {-25, 0}, {0.5f, -0.5f}, {1000, 1}};
    for (auto& expected : velocities) {
        Kinematics k{};
        k.velocity(expected);
        EXPECT_NEAR(k.speed, std::hypot(expected.x, expected.y), 1e-3);
        EXPECT_GE(k.heading, 0);
        EXPECT_LT(k.heading, 360);
        auto v = k.velocity();
        EXPECT_NEAR(v.x, expected.x, 1e-3) << "vx " << expected.x << ", vy " << expected.y;
        EXPECT_NEAR(v.y, expected.y, 1e-3) << "vx " << expected.x << ", vy " << expected.y;
    }
}

TEST(SpriteTest, VelocityComponentsAreIndependent) {
    Sprite sprite{};
    sprite.velocityX(10);
    EXPECT_NEAR(sprite.velocityX(), 10, 1e-3);
    EXPECT_NEAR(sprite.velocityY(), 0, 1e-3);
    sprite.velocityY(-10);
    EXPECT_NEAR(sprite.velocityX(), 10, 1e-3);
    EXPECT_NEAR(sprite.velocityY(), -10, 1e-3);
    sprite.velocityX(-sprite.velocityX());
    EXPECT_NEAR(sprite.velocityX(), -10, 1e-3);
    EXPECT_NEAR(sprite.velocityY(), -10, 1e-3);
}

TEST(SpriteTest, RenderDrawsScaledImageCentred) {
    auto image = sdlmodel::Surface::create(100, 50, SDL_PIXELFORMAT_RGBA8888);
    Sprite sprite{image, 200, 100, 0.5f};
    scenes_test::RecordingTarget target{};
    sprite.render(target);

    ASSERT_EQ(target.calls.size(), 1u);
    EXPECT_EQ(target.calls[0], "renderSurface");
    auto d = target.destinations[0];
    EXPECT_FLOAT_EQ(d.x, 175);
    EXPECT_FLOAT_EQ(d.y, 87.5f);
    EXPECT_FLOAT_EQ(d.w, 50);
    EXPECT_FLOAT_EQ(d.h, 25);
}

TEST(SpriteTest, RotatedSpriteUsesRotatedRendering) {
    auto image = sdlmodel::Surface::create(10, 10, SDL_PIXELFORMAT_RGBA8888);
    Sprite sprite{image, 0, 0};
    sprite.rotation(45);
    scenes_test::RecordingTarget target{};
    sprite.render(target);
    ASSERT_EQ(target.calls.size(), 1u);
    EXPECT_EQ(target.calls[0], "renderSurfaceRotated");
    EXPECT_DOUBLE_EQ(target.angles[0], 45);
}

TEST(SpriteTest, SpriteWithoutImageDrawsNothing) {
    Sprite sprite{};
    scenes_test::RecordingTarget target{};
    sprite.render(target);

    auto image = sdlmodel::Surface::create(10, 10, SDL_PIXELFORMAT_RGBA8888);
    Sprite disposedImage{image, 0, 0};
    image->dispose();
    disposedImage.render(target);
    EXPECT_TRUE(target.calls.empty());
}
