#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <SDL3/SDL.h>
#include "color.hpp"
#include "disposable.hpp"
#include "native-handle.hpp"
#include "palette.hpp"

namespace sdlmodel {

    // A bitmap in system memory. Surfaces register themselves with the current application
    // (if any), which disposes them when it shuts down.
    class Surface : public Disposable, public std::enable_shared_from_this<Surface> {
        NativeHandle<SDL_Surface*, SDL_DestroySurface> surface_;
        bool hasTransparentColor_{false};

        static std::shared_ptr<Surface> adopt(SDL_Surface* surface);

    public:
        explicit Surface(SDL_Surface* surface);
        ~Surface() override = default;

        // Throws std::runtime_error when SDL cannot create the surface.
        static std::shared_ptr<Surface> create(int width, int height, SDL_PixelFormat format);
        // Takes ownership of a surface created by SDL or an SDL extension library.
        // Throws std::runtime_error (with `what` and the SDL error) when `surface` is null.
        static std::shared_ptr<Surface> wrap(SDL_Surface* surface, const char* what);
        // Throws std::runtime_error when the file cannot be loaded.
        static std::shared_ptr<Surface> loadBitmap(const std::filesystem::path& path);
        bool saveBitmap(const std::filesystem::path& path);

        // Converted copy in another pixel format. Throws std::runtime_error on failure.
        std::shared_ptr<Surface> convert(SDL_PixelFormat format);

        SDL_Surface* handle() const { return surface_.get(); }
        void dispose() override;
        bool disposed() const override { return !surface_.alive(); }

        SDL_SurfaceFlags flags() const;
        std::optional<SDL_Color> transparentColor() const;
        void transparentColor(std::optional<SDL_Color> color);
        Palette palette() const;
        int pitch() const;
        SDL_PixelFormat pixelFormat() const;
        const SDL_PixelFormatDetails* pixelFormatDetails() const;
        int bytesPerPixel() const;
        SDL_Point size() const;

        // Out of range coordinates read as a default color and ignore writes.
        SDL_Color getPixel(int x, int y) const;
        void setPixel(int x, int y, SDL_Color color);

        SDL_Color mapToColor(uint32_t pixel) const;
        uint32_t mapToPixel(SDL_Color color) const;
    };

    // A single pixel visited by `transformPixels()`. The color is read lazily; assigning it writes through.
    class PixelContext {
        Surface& surface_;
        std::optional<SDL_Color> color_{};

    public:
        const int x;
        const int y;

        PixelContext(Surface& surface, int x, int y) : surface_(surface), x(x), y(y) {}

        SDL_Color color();
        void color(SDL_Color value);
    };

    void transformPixels(Surface& surface, const std::function<void(PixelContext& context)>& action);
    void replaceMatchingColor(Surface& surface, SDL_Color oldColor, SDL_Color newColor, int tolerance = DefaultColorTolerance);
    // Sets the alpha of the pixels close to `color`.
    void setAlpha(Surface& surface, uint8_t alpha, SDL_Color color, int tolerance = DefaultColorTolerance);

}
