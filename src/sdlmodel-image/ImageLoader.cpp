#include <sdlmodel-image/sdlmodel-image.hpp>
#include <SDL3_image/SDL_image.h>

std::shared_ptr<sdlmodel::Surface> sdlmodel::loadImage(const std::filesystem::path& path, SDL_PixelFormat format) {
    auto what = std::format("Cannot load image {}", path.string());
    auto decoded = Surface::wrap(IMG_Load(path.string().c_str()), what.c_str());
    if (decoded->pixelFormat() == format)
        return decoded;
    auto converted = decoded->convert(format);
    decoded->dispose();
    return converted;
}
