#include <sdlmodel/sdlmodel.hpp>

sdlmodel::Renderer::Renderer(Window* window) : window_(window) {
    auto renderer = SDL_CreateRenderer(window->handle(), nullptr);
    if (!renderer) {
        Logger::global()->logError("Cannot create renderer: %s", SDL_GetError());
        throw std::runtime_error(std::format("Cannot create renderer: {}", SDL_GetError()));
    }
    renderer_.adopt(renderer);
}

sdlmodel::Renderer::~Renderer() {
    dispose();
}

void sdlmodel::Renderer::dispose() {
    if (disposed())
        return;
    {
        std::lock_guard<std::mutex> lock(surfaceTexturesMutex_);
        surfaceTextures_.clear();
    }
    textures_.disposeAll();
    renderer_.reset();
}

// Properties -----------------------------------------------------------------

SDL_BlendMode sdlmodel::Renderer::blendMode() const {
    SDL_BlendMode ret{SDL_BLENDMODE_NONE};
    if (!disposed())
        SDL_GetRenderDrawBlendMode(renderer_.get(), &ret);
    return ret;
}

void sdlmodel::Renderer::blendMode(SDL_BlendMode value) {
    if (!disposed())
        SDL_SetRenderDrawBlendMode(renderer_.get(), value);
}

std::optional<SDL_Rect> sdlmodel::Renderer::clipRect() const {
    if (!clipEnabled())
        return std::nullopt;
    SDL_Rect ret{};
    SDL_GetRenderClipRect(renderer_.get(), &ret);
    return ret;
}

void sdlmodel::Renderer::clipRect(std::optional<SDL_Rect> rect) {
    if (disposed())
        return;
    SDL_SetRenderClipRect(renderer_.get(), rect ? &*rect : nullptr);
}

bool sdlmodel::Renderer::clipEnabled() const {
    return !disposed() && SDL_RenderClipEnabled(renderer_.get());
}

float sdlmodel::Renderer::colorScale() const {
    float ret{0};
    if (!disposed())
        SDL_GetRenderColorScale(renderer_.get(), &ret);
    return ret;
}

void sdlmodel::Renderer::colorScale(float value) {
    if (!disposed())
        SDL_SetRenderColorScale(renderer_.get(), value);
}

SDL_ScaleMode sdlmodel::Renderer::defaultScaleMode() const {
    SDL_ScaleMode ret{SDL_SCALEMODE_LINEAR};
    if (!disposed())
        SDL_GetDefaultTextureScaleMode(renderer_.get(), &ret);
    return ret;
}

void sdlmodel::Renderer::defaultScaleMode(SDL_ScaleMode value) {
    if (!disposed())
        SDL_SetDefaultTextureScaleMode(renderer_.get(), value);
}

SDL_Color sdlmodel::Renderer::drawColor() const {
    SDL_Color ret{};
    if (!disposed())
        SDL_GetRenderDrawColor(renderer_.get(), &ret.r, &ret.g, &ret.b, &ret.a);
    return ret;
}

void sdlmodel::Renderer::drawColor(SDL_Color color) {
    if (!disposed())
        SDL_SetRenderDrawColor(renderer_.get(), color.r, color.g, color.b, color.a);
}

SDL_FColor sdlmodel::Renderer::drawColorFloat() const {
    SDL_FColor ret{};
    if (!disposed())
        SDL_GetRenderDrawColorFloat(renderer_.get(), &ret.r, &ret.g, &ret.b, &ret.a);
    return ret;
}

void sdlmodel::Renderer::drawColorFloat(SDL_FColor color) {
    if (!disposed())
        SDL_SetRenderDrawColorFloat(renderer_.get(), color.r, color.g, color.b, color.a);
}

sdlmodel::LogicalPresentation sdlmodel::Renderer::logicalPresentation() const {
    LogicalPresentation ret{0, 0, SDL_LOGICAL_PRESENTATION_DISABLED};
    if (!disposed())
        SDL_GetRenderLogicalPresentation(renderer_.get(), &ret.width, &ret.height, &ret.mode);
    return ret;
}

void sdlmodel::Renderer::logicalPresentation(LogicalPresentation value) {
    if (!disposed())
        SDL_SetRenderLogicalPresentation(renderer_.get(), value.width, value.height, value.mode);
}

SDL_FRect sdlmodel::Renderer::logicalPresentationRect() const {
    SDL_FRect ret{};
    if (!disposed())
        SDL_GetRenderLogicalPresentationRect(renderer_.get(), &ret);
    return ret;
}

std::string sdlmodel::Renderer::name() const {
    if (disposed())
        return "";
    auto s = SDL_GetRendererName(renderer_.get());
    return s ? s : "";
}

SDL_Point sdlmodel::Renderer::outputSize() const {
    SDL_Point ret{0, 0};
    if (!disposed())
        SDL_GetRenderOutputSize(renderer_.get(), &ret.x, &ret.y);
    return ret;
}

SDL_FPoint sdlmodel::Renderer::scale() const {
    SDL_FPoint ret{0, 0};
    if (!disposed())
        SDL_GetRenderScale(renderer_.get(), &ret.x, &ret.y);
    return ret;
}

void sdlmodel::Renderer::scale(SDL_FPoint value) {
    if (!disposed())
        SDL_SetRenderScale(renderer_.get(), value.x, value.y);
}

SDL_Rect sdlmodel::Renderer::viewport() const {
    SDL_Rect ret{};
    if (!disposed())
        SDL_GetRenderViewport(renderer_.get(), &ret);
    return ret;
}

void sdlmodel::Renderer::viewport(SDL_Rect value) {
    if (!disposed())
        SDL_SetRenderViewport(renderer_.get(), &value);
}

// Textures -------------------------------------------------------------------

std::shared_ptr<sdlmodel::Texture> sdlmodel::Renderer::createTexture(int width, int height, SDL_PixelFormat format, SDL_TextureAccess access) {
    if (disposed())
        throw std::runtime_error("Cannot create a texture on a disposed renderer");
    auto texture = SDL_CreateTexture(renderer_.get(), format, access, width, height);
    if (!texture) {
        Logger::global()->logError("Cannot create texture: %s", SDL_GetError());
        throw std::runtime_error(std::format("Cannot create texture: {}", SDL_GetError()));
    }
    auto ret = std::make_shared<Texture>(this, texture);
    textures_.track(ret);
    return ret;
}

std::shared_ptr<sdlmodel::Texture> sdlmodel::Renderer::createTexture(Surface& surface) {
    if (disposed() || surface.disposed())
        throw std::runtime_error("Cannot create a texture from a disposed renderer or surface");
    auto texture = SDL_CreateTextureFromSurface(renderer_.get(), surface.handle());
    if (!texture) {
        Logger::global()->logError("Cannot create texture from surface: %s", SDL_GetError());
        throw std::runtime_error(std::format("Cannot create texture from surface: {}", SDL_GetError()));
    }
    auto ret = std::make_shared<Texture>(this, texture);
    textures_.track(ret);
    return ret;
}

std::shared_ptr<sdlmodel::Texture> sdlmodel::Renderer::textureFor(Surface& surface) {
    if (surface.disposed())
        return nullptr;
    std::lock_guard<std::mutex> lock(surfaceTexturesMutex_);
    std::erase_if(surfaceTextures_, [](auto& entry) { return entry.second.surface.expired(); });

    auto it = surfaceTextures_.find(&surface);
    if (it != surfaceTextures_.end() && !it->second.texture->disposed())
        return it->second.texture;

    auto texture = createTexture(surface);
    surfaceTextures_[&surface] = CachedTexture{surface.weak_from_this(), texture};
    return texture;
}

// Rendering ------------------------------------------------------------------

bool sdlmodel::Renderer::clear() {
    return !disposed() && SDL_RenderClear(renderer_.get());
}

bool sdlmodel::Renderer::present() {
    return !disposed() && SDL_RenderPresent(renderer_.get());
}

bool sdlmodel::Renderer::renderDebugText(float x, float y, const std::string& text, float scale) {
    if (disposed())
        return false;
    if (scale > 0) {
        auto old = this->scale();
        this->scale(SDL_FPoint{scale, scale});
        auto result = SDL_RenderDebugText(renderer_.get(), x / scale, y / scale, text.c_str());
        this->scale(old);
        return result;
    }
    return SDL_RenderDebugText(renderer_.get(), x, y, text.c_str());
}

bool sdlmodel::Renderer::fillRect(const SDL_FRect& rect) {
    return !disposed() && SDL_RenderFillRect(renderer_.get(), &rect);
}

bool sdlmodel::Renderer::renderTexture(Texture& texture, const SDL_FRect& source, const SDL_FRect& destination) {
    if (disposed() || texture.disposed())
        return false;
    return SDL_RenderTexture(renderer_.get(), texture.handle(), &source, &destination);
}

bool sdlmodel::Renderer::renderTexture(Texture& texture, const SDL_FRect& destination) {
    auto size = texture.size();
    return renderTexture(texture, SDL_FRect{0, 0, size.x, size.y}, destination);
}

bool sdlmodel::Renderer::renderTexture(Texture& texture, float x, float y, float scale) {
    auto size = texture.size();
    return renderTexture(texture, SDL_FRect{0, 0, size.x, size.y}, SDL_FRect{x, y, size.x * scale, size.y * scale});
}

bool sdlmodel::Renderer::renderTextureRotated(Texture& texture, const SDL_FRect& source, const SDL_FRect& destination,
                                              double angle, SDL_FPoint center, SDL_FlipMode flip) {
    if (disposed() || texture.disposed())
        return false;
    return SDL_RenderTextureRotated(renderer_.get(), texture.handle(), &source, &destination, angle, &center, flip);
}

bool sdlmodel::Renderer::renderTextureRotated(Texture& texture, const SDL_FRect& destination, double angle, SDL_FPoint center, SDL_FlipMode flip) {
    auto size = texture.size();
    return renderTextureRotated(texture, SDL_FRect{0, 0, size.x, size.y}, destination, angle, center, flip);
}

bool sdlmodel::Renderer::renderTextureRotated(Texture& texture, float x, float y, double angle, float centerX, float centerY, float scale, SDL_FlipMode flip) {
    auto size = texture.size();
    return renderTextureRotated(texture, SDL_FRect{0, 0, size.x, size.y}, SDL_FRect{x, y, size.x * scale, size.y * scale},
                                angle, SDL_FPoint{centerX * scale, centerY * scale}, flip);
}

bool sdlmodel::Renderer::renderSurface(Surface& surface, const SDL_FRect& source, const SDL_FRect& destination) {
    if (disposed())
        return false;
    auto texture = textureFor(surface);
    return texture && renderTexture(*texture, source, destination);
}

bool sdlmodel::Renderer::renderSurface(Surface& surface, const SDL_FRect& destination) {
    if (disposed())
        return false;
    auto texture = textureFor(surface);
    return texture && renderTexture(*texture, destination);
}

bool sdlmodel::Renderer::renderSurface(Surface& surface, float x, float y, float scale) {
    if (disposed())
        return false;
    auto texture = textureFor(surface);
    return texture && renderTexture(*texture, x, y, scale);
}

bool sdlmodel::Renderer::renderSurfaceRotated(Surface& surface, const SDL_FRect& source, const SDL_FRect& destination,
                                              double angle, SDL_FPoint center, SDL_FlipMode flip) {
    if (disposed())
        return false;
    auto texture = textureFor(surface);
    return texture && renderTextureRotated(*texture, source, destination, angle, center, flip);
}

bool sdlmodel::Renderer::renderSurfaceRotated(Surface& surface, const SDL_FRect& destination, double angle, SDL_FPoint center, SDL_FlipMode flip) {
    if (disposed())
        return false;
    auto texture = textureFor(surface);
    return texture && renderTextureRotated(*texture, destination, angle, center, flip);
}

bool sdlmodel::Renderer::renderSurfaceRotated(Surface& surface, float x, float y, double angle, float centerX, float centerY, float scale, SDL_FlipMode flip) {
    if (disposed())
        return false;
    auto texture = textureFor(surface);
    return texture && renderTextureRotated(*texture, x, y, angle, centerX, centerY, scale, flip);
}
