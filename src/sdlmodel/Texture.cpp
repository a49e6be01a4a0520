#include <sdlmodel/sdlmodel.hpp>

sdlmodel::Texture::Texture(Renderer* renderer, SDL_Texture* texture) :
    texture_(texture), renderer_(renderer) {
}

void sdlmodel::Texture::dispose() {
    texture_.reset();
}

uint8_t sdlmodel::Texture::alphaMod() const {
    uint8_t ret{0};
    if (!disposed())
        SDL_GetTextureAlphaMod(texture_.get(), &ret);
    return ret;
}

void sdlmodel::Texture::alphaMod(uint8_t value) {
    if (!disposed())
        SDL_SetTextureAlphaMod(texture_.get(), value);
}

float sdlmodel::Texture::alphaModFloat() const {
    float ret{0};
    if (!disposed())
        SDL_GetTextureAlphaModFloat(texture_.get(), &ret);
    return ret;
}

void sdlmodel::Texture::alphaModFloat(float value) {
    if (!disposed())
        SDL_SetTextureAlphaModFloat(texture_.get(), value);
}

SDL_BlendMode sdlmodel::Texture::blendMode() const {
    SDL_BlendMode ret{SDL_BLENDMODE_NONE};
    if (!disposed())
        SDL_GetTextureBlendMode(texture_.get(), &ret);
    return ret;
}

void sdlmodel::Texture::blendMode(SDL_BlendMode value) {
    if (!disposed())
        SDL_SetTextureBlendMode(texture_.get(), value);
}

SDL_Color sdlmodel::Texture::colorMod() const {
    SDL_Color ret{0, 0, 0, 255};
    if (!disposed())
        SDL_GetTextureColorMod(texture_.get(), &ret.r, &ret.g, &ret.b);
    return ret;
}

void sdlmodel::Texture::colorMod(SDL_Color value) {
    if (!disposed())
        SDL_SetTextureColorMod(texture_.get(), value.r, value.g, value.b);
}

SDL_FColor sdlmodel::Texture::colorModFloat() const {
    SDL_FColor ret{0, 0, 0, 1};
    if (!disposed())
        SDL_GetTextureColorModFloat(texture_.get(), &ret.r, &ret.g, &ret.b);
    return ret;
}

void sdlmodel::Texture::colorModFloat(SDL_FColor value) {
    if (!disposed())
        SDL_SetTextureColorModFloat(texture_.get(), value.r, value.g, value.b);
}

SDL_ScaleMode sdlmodel::Texture::scaleMode() const {
    SDL_ScaleMode ret{SDL_SCALEMODE_LINEAR};
    if (!disposed())
        SDL_GetTextureScaleMode(texture_.get(), &ret);
    return ret;
}

void sdlmodel::Texture::scaleMode(SDL_ScaleMode value) {
    if (!disposed())
        SDL_SetTextureScaleMode(texture_.get(), value);
}

SDL_FPoint sdlmodel::Texture::size() const {
    SDL_FPoint ret{0, 0};
    if (!disposed())
        SDL_GetTextureSize(texture_.get(), &ret.x, &ret.y);
    return ret;
}
