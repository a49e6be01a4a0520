#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include "prop.hpp"

namespace sdlmodel::scenes {

    struct Velocity {
        float x;
        float y;
    };

    struct Motion {
        float speed;
        float heading;
    };

    // Position and rotation of a moving object. A heading of 0 degrees points up (negative y),
    // 90 degrees points right.
    class Kinematics {
    public:
        static constexpr std::chrono::milliseconds MinimumTimeSlice{10};
        static constexpr float VelocityEpsilon = 1e-4f;

        float centerX{0};
        float centerY{0};
        // degrees
        float heading{0};
        // units per second
        float speed{0};
        // degrees
        float rotation{0};
        // degrees per second
        float spin{0};
        // absent until the first update.
        std::optional<std::chrono::nanoseconds> lastUpdate{};

        // The first call only records `now`. Later calls integrate the time since the last committed
        // update unless it is shorter than MinimumTimeSlice. Returns true if anything changed.
        bool update(std::chrono::nanoseconds now);

        Velocity velocity() const { return toVelocity(speed, heading); }
        void velocity(Velocity value);

        static Velocity toVelocity(float speed, float heading);
        static Motion toMotion(Velocity velocity);
    };

    // An image that moves, spins and scales.
    class Sprite : public Prop {
        std::shared_ptr<Surface> image_{};
        Kinematics kinematics_{};

    public:
        Sprite() = default;
        Sprite(std::shared_ptr<Surface> image, float centerX, float centerY, float scale = 1.0f);

        float scale{1.0f};
        SDL_FlipMode flip{SDL_FLIP_NONE};

        std::shared_ptr<Surface> image() const { return image_; }
        void image(std::shared_ptr<Surface> value) { image_ = std::move(value); }
        Kinematics& kinematics() { return kinematics_; }
        const Kinematics& kinematics() const { return kinematics_; }

        float centerX() const { return kinematics_.centerX; }
        void centerX(float value) { kinematics_.centerX = value; }
        float centerY() const { return kinematics_.centerY; }
        void centerY(float value) { kinematics_.centerY = value; }
        float heading() const { return kinematics_.heading; }
        void heading(float value) { kinematics_.heading = value; }
        float speed() const { return kinematics_.speed; }
        void speed(float value) { kinematics_.speed = value; }
        float rotation() const { return kinematics_.rotation; }
        void rotation(float value) { kinematics_.rotation = value; }
        float spin() const { return kinematics_.spin; }
        void spin(float value) { kinematics_.spin = value; }

        float velocityX() const { return kinematics_.velocity().x; }
        void velocityX(float value) { kinematics_.velocity({value, velocityY()}); }
        float velocityY() const { return kinematics_.velocity().y; }
        void velocityY(float value) { kinematics_.velocity({velocityX(), value}); }

        bool update(const UpdateContext& context) override;
        // Draws the image centred on the position, scaled and rotated about its centre.
        void render(RenderTarget& target) override;
    };

}
