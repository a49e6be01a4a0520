#pragma once

#include <memory>
#include <SDL3/SDL.h>
#include "disposable.hpp"
#include "native-handle.hpp"

namespace sdlmodel {

    class Renderer;

    // A GPU-side image created by a `Renderer`, which disposes it when the renderer goes away.
    class Texture : public Disposable {
        NativeHandle<SDL_Texture*, SDL_DestroyTexture> texture_;
        Renderer* renderer_;

    public:
        Texture(Renderer* renderer, SDL_Texture* texture);
        ~Texture() override = default;

        SDL_Texture* handle() const { return texture_.get(); }
        Renderer* renderer() const { return renderer_; }
        void dispose() override;
        bool disposed() const override { return !texture_.alive(); }

        uint8_t alphaMod() const;
        void alphaMod(uint8_t value);
        float alphaModFloat() const;
        void alphaModFloat(float value);
        SDL_BlendMode blendMode() const;
        void blendMode(SDL_BlendMode value);
        SDL_Color colorMod() const;
        void colorMod(SDL_Color value);
        SDL_FColor colorModFloat() const;
        void colorModFloat(SDL_FColor value);
        SDL_ScaleMode scaleMode() const;
        void scaleMode(SDL_ScaleMode value);
        SDL_FPoint size() const;
    };

}
