#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <SDL3/SDL.h>
#include "disposable.hpp"
#include "native-handle.hpp"
#include "render-target.hpp"
#include "texture.hpp"

namespace sdlmodel {

    class Window;

    struct LogicalPresentation {
        int width;
        int height;
        SDL_RendererLogicalPresentation mode;
    };

    // The 2D renderer of a window. Every operation is a no-op (returning a default value or false)
    // once the renderer is disposed.
    class Renderer : public RenderTarget, public Disposable {
        NativeHandle<SDL_Renderer*, SDL_DestroyRenderer> renderer_;
        Window* window_;
        ResourceTracker textures_{};
        struct CachedTexture {
            std::weak_ptr<Surface> surface;
            std::shared_ptr<Texture> texture;
        };
        std::map<const Surface*, CachedTexture> surfaceTextures_{};
        std::mutex surfaceTexturesMutex_{};

        std::shared_ptr<Texture> textureFor(Surface& surface);

    public:
        // Throws std::runtime_error when SDL cannot create a renderer for the window.
        explicit Renderer(Window* window);
        ~Renderer() override;

        SDL_Renderer* handle() const { return renderer_.get(); }
        Window* window() const { return window_; }
        void dispose() override;
        bool disposed() const override { return !renderer_.alive(); }
        size_t liveTextureCount() const { return textures_.liveCount(); }

        SDL_BlendMode blendMode() const;
        void blendMode(SDL_BlendMode value);
        std::optional<SDL_Rect> clipRect() const override;
        void clipRect(std::optional<SDL_Rect> rect) override;
        bool clipEnabled() const;
        float colorScale() const;
        void colorScale(float value);
        SDL_ScaleMode defaultScaleMode() const;
        void defaultScaleMode(SDL_ScaleMode value);
        SDL_Color drawColor() const override;
        void drawColor(SDL_Color color) override;
        SDL_FColor drawColorFloat() const;
        void drawColorFloat(SDL_FColor color);
        LogicalPresentation logicalPresentation() const;
        void logicalPresentation(LogicalPresentation value);
        SDL_FRect logicalPresentationRect() const;
        std::string name() const;
        SDL_Point outputSize() const;
        SDL_FPoint scale() const;
        void scale(SDL_FPoint value);
        SDL_Rect viewport() const;
        void viewport(SDL_Rect value);

        // Both throw std::runtime_error when SDL cannot create the texture.
        std::shared_ptr<Texture> createTexture(int width, int height, SDL_PixelFormat format, SDL_TextureAccess access);
        std::shared_ptr<Texture> createTexture(Surface& surface);

        bool clear();
        bool present();
        bool renderDebugText(float x, float y, const std::string& text, float scale = 0) override;
        bool fillRect(const SDL_FRect& rect) override;

        bool renderTexture(Texture& texture, const SDL_FRect& source, const SDL_FRect& destination);
        bool renderTexture(Texture& texture, const SDL_FRect& destination);
        bool renderTexture(Texture& texture, float x, float y, float scale = 1.0f);
        bool renderTextureRotated(Texture& texture, const SDL_FRect& source, const SDL_FRect& destination,
                                  double angle, SDL_FPoint center, SDL_FlipMode flip = SDL_FLIP_NONE);
        bool renderTextureRotated(Texture& texture, const SDL_FRect& destination, double angle, SDL_FPoint center, SDL_FlipMode flip = SDL_FLIP_NONE);
        // The rotation center is given in unscaled image coordinates.
        bool renderTextureRotated(Texture& texture, float x, float y, double angle, float centerX, float centerY, float scale = 1.0f, SDL_FlipMode flip = SDL_FLIP_NONE);

        // Surfaces are drawn through a texture cached per surface.
        bool renderSurface(Surface& surface, const SDL_FRect& source, const SDL_FRect& destination) override;
        bool renderSurface(Surface& surface, const SDL_FRect& destination);
        bool renderSurface(Surface& surface, float x, float y, float scale = 1.0f);
        bool renderSurfaceRotated(Surface& surface, const SDL_FRect& source, const SDL_FRect& destination,
                                  double angle, SDL_FPoint center, SDL_FlipMode flip = SDL_FLIP_NONE) override;
        bool renderSurfaceRotated(Surface& surface, const SDL_FRect& destination, double angle, SDL_FPoint center, SDL_FlipMode flip = SDL_FLIP_NONE);
        // The rotation center is given in unscaled image coordinates.
        bool renderSurfaceRotated(Surface& surface, float x, float y, double angle, float centerX, float centerY, float scale = 1.0f, SDL_FlipMode flip = SDL_FLIP_NONE);
    };

}
