#pragma once

#include <optional>
#include <string>
#include <SDL3/SDL.h>

namespace sdlmodel {

    class Surface;

    // What props draw onto. `Renderer` is the SDL-backed implementation.
    class RenderTarget {
    public:
        virtual ~RenderTarget() = default;

        // nullopt when clipping is disabled.
        virtual std::optional<SDL_Rect> clipRect() const = 0;
        virtual void clipRect(std::optional<SDL_Rect> rect) = 0;
        virtual SDL_Color drawColor() const = 0;
        virtual void drawColor(SDL_Color color) = 0;

        virtual bool fillRect(const SDL_FRect& rect) = 0;
        virtual bool renderSurface(Surface& surface, const SDL_FRect& source, const SDL_FRect& destination) = 0;
        virtual bool renderSurfaceRotated(Surface& surface, const SDL_FRect& source, const SDL_FRect& destination,
                                          double angle, SDL_FPoint center, SDL_FlipMode flip = SDL_FLIP_NONE) = 0;
        // A positive `scale` enlarges the text; the position is given in unscaled coordinates.
        virtual bool renderDebugText(float x, float y, const std::string& text, float scale = 0) = 0;
    };

}
