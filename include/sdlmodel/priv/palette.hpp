#pragma once

#include <vector>
#include <SDL3/SDL.h>

namespace sdlmodel {

    // Read-only view of a palette that belongs to a surface. It is never destroyed from here.
    class Palette {
        SDL_Palette* palette_{};

    public:
        Palette() = default;
        explicit Palette(SDL_Palette* borrowed) : palette_(borrowed) {}

        SDL_Palette* handle() const { return palette_; }
        bool empty() const { return palette_ == nullptr || palette_->ncolors == 0; }
        int count() const { return palette_ ? palette_->ncolors : 0; }
        SDL_Color color(int index) const;
        std::vector<SDL_Color> colors() const;
    };

}
