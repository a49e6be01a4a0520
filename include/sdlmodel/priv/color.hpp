#pragma once

#include <cstdint>
#include <SDL3/SDL.h>

namespace sdlmodel {

    constexpr int DefaultColorTolerance = 8;

    inline SDL_Color withAlpha(SDL_Color color, uint8_t alpha) {
        return SDL_Color{color.r, color.g, color.b, alpha};
    }

    // True when the Euclidean RGB distance is within `tolerance`. Alpha is not compared.
    inline bool isCloseTo(SDL_Color color, SDL_Color other, int tolerance = DefaultColorTolerance) {
        int dr = color.r - other.r;
        int dg = color.g - other.g;
        int db = color.b - other.b;
        return dr * dr + dg * dg + db * db <= tolerance * tolerance;
    }

    inline bool sameColor(SDL_Color a, SDL_Color b) {
        return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
    }

}
