#pragma once

#include <optional>
#include <string>
#include <vector>
#include <SDL3/SDL.h>

namespace sdlmodel {

    // A connected display. Display values are cheap handles over an SDL display id.
    class Display {
        SDL_DisplayID id_;

    public:
        explicit Display(SDL_DisplayID id) : id_(id) {}

        SDL_DisplayID id() const { return id_; }
        std::string name() const;
        // Empty rectangles when SDL cannot tell.
        SDL_Rect bounds() const;
        SDL_Rect usableBounds() const;
        float contentScale() const;
        SDL_DisplayMode displayMode() const;
        SDL_DisplayMode desktopDisplayMode() const;
        std::vector<SDL_DisplayMode> fullScreenDisplayModes() const;
        SDL_DisplayOrientation naturalOrientation() const;
        SDL_DisplayOrientation orientation() const;
        // Falls back to the desktop mode when no full screen mode matches.
        SDL_DisplayMode closestFullScreenDisplayMode(int width, int height, float refreshRate = 60.0f, bool includeHighDensityModes = false) const;

        static std::vector<Display> displays();
        // Throws std::runtime_error when there is no display.
        static Display primaryDisplay();
        static std::optional<Display> displayForPoint(SDL_Point point);
        static std::optional<Display> displayForRect(SDL_Rect rect);
    };

}
