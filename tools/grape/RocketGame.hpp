#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <sdlmodel-scenes/sdlmodel-scenes.hpp>

namespace grape {

    // A sprite that bounces off the edges of the window. Key handlers and rendering run on the
    // application thread while step() runs on the game loop thread, so every member locks.
    class RocketGame {
        mutable std::mutex mutex_{};
        sdlmodel::scenes::Sprite rocket_;

    public:
        static constexpr float KeyVelocityStep = 10.0f;

        explicit RocketGame(sdlmodel::scenes::Sprite rocket) : rocket_(std::move(rocket)) {}

        // Advances the rocket and reverses its velocity on each axis where it left `bounds`.
        // Returns true if the rocket moved or turned.
        bool step(std::chrono::nanoseconds now, SDL_Rect bounds);

        // Arrow keys nudge the velocity. Returns true if the key was handled.
        bool handleKey(SDL_Keycode key);

        void render(sdlmodel::RenderTarget& target);
        std::string statusText() const;

        sdlmodel::scenes::Velocity velocity() const;
        SDL_FPoint center() const;
    };

}
