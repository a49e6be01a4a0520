#pragma once

#include <chrono>
#include <SDL3/SDL.h>
#include <sdlmodel/sdlmodel.hpp>

namespace sdlmodel::scenes {

    struct UpdateContext {
        // elapsed since the loop started.
        std::chrono::nanoseconds time;
        // the area the prop is laid out into.
        SDL_Rect bounds;
    };

    // A node of the scene graph.
    class Prop {
    public:
        virtual ~Prop() = default;

        // Advances the state to `context.time`. Returns true if anything visible changed.
        virtual bool update(const UpdateContext& context) = 0;
        virtual void render(RenderTarget& target) = 0;
    };

}
