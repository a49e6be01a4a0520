#include <cmath>
#include <numbers>
#include <sdlmodel-scenes/sdlmodel-scenes.hpp>

namespace {
    constexpr double toRadians(double degrees) { return degrees * std::numbers::pi / 180.0; }
    constexpr double toDegrees(double radians) { return radians * 180.0 / std::numbers::pi; }

    float snapToZero(double value) {
        return std::abs(value) < sdlmodel::scenes::Kinematics::VelocityEpsilon ? 0.0f : static_cast<float>(value);
    }
}

sdlmodel::scenes::Velocity sdlmodel::scenes::Kinematics::toVelocity(float speed, float heading) {
    auto angle = toRadians(heading - 90.0);
    return Velocity{snapToZero(speed * std::cos(angle)), snapToZero(speed * std::sin(angle))};
}

sdlmodel::scenes::Motion sdlmodel::scenes::Kinematics::toMotion(Velocity velocity) {
    auto speed = std::sqrt(double(velocity.x) * velocity.x + double(velocity.y) * velocity.y);
    auto heading = std::fmod(toDegrees(std::atan2(velocity.y, velocity.x)) + 90.0, 360.0);
    if (heading < 0)
        heading += 360.0;
    // fmod may round up to exactly 360 for tiny negative angles.
    if (heading >= 360.0)
        heading = 0;
    return Motion{static_cast<float>(speed), static_cast<float>(heading)};
}

void sdlmodel::scenes::Kinematics::velocity(Velocity value) {
    auto motion = toMotion(value);
    speed = motion.speed;
    heading = motion.heading;
}

bool sdlmodel::scenes::Kinematics::update(std::chrono::nanoseconds now) {
    if (!lastUpdate) {
        lastUpdate = now;
        return true;
    }

    auto delta = now - *lastUpdate;
    if (delta < MinimumTimeSlice)
        return false;
    double seconds = std::chrono::duration<double>(delta).count();

    auto newRotation = static_cast<float>(std::fmod(rotation + spin * seconds, 360.0));
    auto v = velocity();
    auto newCenterX = static_cast<float>(centerX + v.x * seconds);
    auto newCenterY = static_cast<float>(centerY + v.y * seconds);

    if (newRotation == rotation && newCenterX == centerX && newCenterY == centerY)
        return false;

    rotation = newRotation;
    centerX = newCenterX;
    centerY = newCenterY;
    lastUpdate = now;
    return true;
}

sdlmodel::scenes::Sprite::Sprite(std::shared_ptr<Surface> image, float centerX, float centerY, float scale) :
    image_(std::move(image)), scale(scale) {
    kinematics_.centerX = centerX;
    kinematics_.centerY = centerY;
}

bool sdlmodel::scenes::Sprite::update(const UpdateContext& context) {
    return kinematics_.update(context.time);
}

void sdlmodel::scenes::Sprite::render(RenderTarget& target) {
    auto image = image_;
    if (!image || image->disposed())
        return;

    auto size = image->size();
    float scaledWidth = size.x * scale;
    float scaledHeight = size.y * scale;
    SDL_FRect source{0, 0, static_cast<float>(size.x), static_cast<float>(size.y)};
    SDL_FRect destination{centerX() - scaledWidth / 2, centerY() - scaledHeight / 2, scaledWidth, scaledHeight};

    if (rotation() != 0 || flip != SDL_FLIP_NONE)
        target.renderSurfaceRotated(*image, source, destination, rotation(), SDL_FPoint{scaledWidth / 2, scaledHeight / 2}, flip);
    else
        target.renderSurface(*image, source, destination);
}
