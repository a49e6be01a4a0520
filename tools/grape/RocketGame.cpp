#include "RocketGame.hpp"
#include <format>

bool grape::RocketGame::step(std::chrono::nanoseconds now, SDL_Rect bounds) {
    std::lock_guard lock(mutex_);
    sdlmodel::scenes::UpdateContext context{now, bounds};
    if (!rocket_.update(context))
        return false;

    auto v = rocket_.kinematics().velocity();
    bool bounced = false;
    // reverse only while still moving outward.
    if ((rocket_.centerX() < bounds.x && v.x < 0) || (rocket_.centerX() > bounds.x + bounds.w && v.x > 0)) {
        v.x = -v.x;
        bounced = true;
    }
    if ((rocket_.centerY() < bounds.y && v.y < 0) || (rocket_.centerY() > bounds.y + bounds.h && v.y > 0)) {
        v.y = -v.y;
        bounced = true;
    }
    if (bounced)
        rocket_.kinematics().velocity(v);
    return true;
}

bool grape::RocketGame::handleKey(SDL_Keycode key) {
    std::lock_guard lock(mutex_);
    switch (key) {
        case SDLK_LEFT:
            rocket_.velocityX(rocket_.velocityX() - KeyVelocityStep);
            return true;
        case SDLK_RIGHT:
            rocket_.velocityX(rocket_.velocityX() + KeyVelocityStep);
            return true;
        case SDLK_UP:
            rocket_.velocityY(rocket_.velocityY() - KeyVelocityStep);
            return true;
        case SDLK_DOWN:
            rocket_.velocityY(rocket_.velocityY() + KeyVelocityStep);
            return true;
        default:
            return false;
    }
}

void grape::RocketGame::render(sdlmodel::RenderTarget& target) {
    std::lock_guard lock(mutex_);
    rocket_.render(target);
}

std::string grape::RocketGame::statusText() const {
    std::lock_guard lock(mutex_);
    auto v = rocket_.kinematics().velocity();
    return std::format("vx: {:.1f} vy: {:.1f} vr: {:.1f} x: {:.0f} y: {:.0f} r: {:.0f}",
                       v.x, v.y, rocket_.spin(), rocket_.centerX(), rocket_.centerY(), rocket_.rotation());
}

sdlmodel::scenes::Velocity grape::RocketGame::velocity() const {
    std::lock_guard lock(mutex_);
    return rocket_.kinematics().velocity();
}

SDL_FPoint grape::RocketGame::center() const {
    std::lock_guard lock(mutex_);
    return {rocket_.centerX(), rocket_.centerY()};
}
