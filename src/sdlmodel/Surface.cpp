#include <sdlmodel/sdlmodel.hpp>

sdlmodel::Surface::Surface(SDL_Surface* surface) : surface_(surface) {
}

std::shared_ptr<sdlmodel::Surface> sdlmodel::Surface::adopt(SDL_Surface* surface) {
    auto ret = std::make_shared<Surface>(surface);
    if (auto app = Application::current())
        app->trackResource(ret);
    return ret;
}

std::shared_ptr<sdlmodel::Surface> sdlmodel::Surface::wrap(SDL_Surface* surface, const char* what) {
    if (!surface) {
        Logger::global()->logError("%s: %s", what, SDL_GetError());
        throw std::runtime_error(std::format("{}: {}", what, SDL_GetError()));
    }
    return adopt(surface);
}

std::shared_ptr<sdlmodel::Surface> sdlmodel::Surface::create(int width, int height, SDL_PixelFormat format) {
    return wrap(SDL_CreateSurface(width, height, format), "Cannot create surface");
}

std::shared_ptr<sdlmodel::Surface> sdlmodel::Surface::loadBitmap(const std::filesystem::path& path) {
    auto what = std::format("Cannot load bitmap {}", path.string());
    return wrap(SDL_LoadBMP(path.string().c_str()), what.c_str());
}

bool sdlmodel::Surface::saveBitmap(const std::filesystem::path& path) {
    if (disposed())
        return false;
    if (!SDL_SaveBMP(surface_.get(), path.string().c_str())) {
        Logger::global()->logWarning("Cannot save bitmap %s: %s", path.string().c_str(), SDL_GetError());
        return false;
    }
    return true;
}

std::shared_ptr<sdlmodel::Surface> sdlmodel::Surface::convert(SDL_PixelFormat format) {
    if (disposed())
        throw std::runtime_error("Cannot convert a disposed surface");
    return wrap(SDL_ConvertSurface(surface_.get(), format), "Cannot convert surface");
}

void sdlmodel::Surface::dispose() {
    surface_.reset();
}

SDL_SurfaceFlags sdlmodel::Surface::flags() const {
    auto s = surface_.get();
    return s ? s->flags : 0;
}

std::optional<SDL_Color> sdlmodel::Surface::transparentColor() const {
    if (disposed() || !hasTransparentColor_)
        return std::nullopt;
    uint32_t key{};
    if (!SDL_GetSurfaceColorKey(surface_.get(), &key))
        return std::nullopt;
    return mapToColor(key);
}

void sdlmodel::Surface::transparentColor(std::optional<SDL_Color> color) {
    if (disposed())
        return;
    if (color) {
        SDL_SetSurfaceColorKey(surface_.get(), true, mapToPixel(*color));
        hasTransparentColor_ = true;
    } else {
        SDL_SetSurfaceColorKey(surface_.get(), false, 0);
        hasTransparentColor_ = false;
    }
}

sdlmodel::Palette sdlmodel::Surface::palette() const {
    if (disposed())
        return Palette{};
    return Palette{SDL_GetSurfacePalette(surface_.get())};
}

int sdlmodel::Surface::pitch() const {
    auto s = surface_.get();
    return s ? s->pitch : 0;
}

SDL_PixelFormat sdlmodel::Surface::pixelFormat() const {
    auto s = surface_.get();
    return s ? s->format : SDL_PIXELFORMAT_UNKNOWN;
}

const SDL_PixelFormatDetails* sdlmodel::Surface::pixelFormatDetails() const {
    if (disposed())
        return nullptr;
    return SDL_GetPixelFormatDetails(pixelFormat());
}

int sdlmodel::Surface::bytesPerPixel() const {
    if (disposed())
        return 0;
    return SDL_BYTESPERPIXEL(pixelFormat());
}

SDL_Point sdlmodel::Surface::size() const {
    auto s = surface_.get();
    return s ? SDL_Point{s->w, s->h} : SDL_Point{0, 0};
}

namespace {
    // Keeps the surface locked while its pixels are accessed, when SDL requires it.
    class SurfaceLock {
        SDL_Surface* surface;
        bool locked{false};
    public:
        explicit SurfaceLock(SDL_Surface* surface) : surface(surface) {
            if (SDL_MUSTLOCK(surface))
                locked = SDL_LockSurface(surface);
        }
        ~SurfaceLock() {
            if (locked)
                SDL_UnlockSurface(surface);
        }
    };
}

SDL_Color sdlmodel::Surface::getPixel(int x, int y) const {
    auto s = surface_.get();
    if (!s || x < 0 || y < 0 || x >= s->w || y >= s->h)
        return {};

    auto bpp = bytesPerPixel();
    SurfaceLock lock{s};
    if (!s->pixels)
        return {};
    auto pixel = static_cast<const uint8_t*>(s->pixels) + y * s->pitch + x * bpp;

    uint32_t value{0};
    switch (bpp) {
        case 1:
            value = *pixel;
            break;
        case 2:
            value = *reinterpret_cast<const uint16_t*>(pixel);
            break;
        case 3:
            value = pixel[0] | (pixel[1] << 8) | (pixel[2] << 16);
            break;
        case 4:
            value = *reinterpret_cast<const uint32_t*>(pixel);
            break;
        default:
            return {};
    }
    return mapToColor(value);
}

void sdlmodel::Surface::setPixel(int x, int y, SDL_Color color) {
    auto s = surface_.get();
    if (!s || x < 0 || y < 0 || x >= s->w || y >= s->h)
        return;

    auto bpp = bytesPerPixel();
    auto value = mapToPixel(color);
    SurfaceLock lock{s};
    if (!s->pixels)
        return;
    auto pixel = static_cast<uint8_t*>(s->pixels) + y * s->pitch + x * bpp;

    switch (bpp) {
        case 1:
            *pixel = static_cast<uint8_t>(value);
            break;
        case 2:
            *reinterpret_cast<uint16_t*>(pixel) = static_cast<uint16_t>(value);
            break;
        case 3:
            pixel[0] = value & 0xFF;
            pixel[1] = (value >> 8) & 0xFF;
            pixel[2] = (value >> 16) & 0xFF;
            break;
        case 4:
            *reinterpret_cast<uint32_t*>(pixel) = value;
            break;
        default:
            break;
    }
}

SDL_Color sdlmodel::Surface::mapToColor(uint32_t pixel) const {
    auto details = pixelFormatDetails();
    if (!details)
        return {};
    SDL_Color ret{};
    SDL_GetRGBA(pixel, details, palette().handle(), &ret.r, &ret.g, &ret.b, &ret.a);
    return ret;
}

uint32_t sdlmodel::Surface::mapToPixel(SDL_Color color) const {
    auto details = pixelFormatDetails();
    if (!details)
        return 0;
    return SDL_MapRGBA(details, palette().handle(), color.r, color.g, color.b, color.a);
}

SDL_Color sdlmodel::PixelContext::color() {
    if (!color_)
        color_ = surface_.getPixel(x, y);
    return *color_;
}

void sdlmodel::PixelContext::color(SDL_Color value) {
    color_ = value;
    surface_.setPixel(x, y, value);
}

void sdlmodel::transformPixels(Surface& surface, const std::function<void(PixelContext& context)>& action) {
    auto size = surface.size();
    for (int y = 0; y < size.y; y++) {
        for (int x = 0; x < size.x; x++) {
            PixelContext context{surface, x, y};
            action(context);
        }
    }
}

void sdlmodel::replaceMatchingColor(Surface& surface, SDL_Color oldColor, SDL_Color newColor, int tolerance) {
    transformPixels(surface, [&](PixelContext& context) {
        if (isCloseTo(context.color(), oldColor, tolerance))
            context.color(newColor);
    });
}

void sdlmodel::setAlpha(Surface& surface, uint8_t alpha, SDL_Color color, int tolerance) {
    transformPixels(surface, [&](PixelContext& context) {
        if (isCloseTo(context.color(), color, tolerance))
            context.color(withAlpha(context.color(), alpha));
    });
}
