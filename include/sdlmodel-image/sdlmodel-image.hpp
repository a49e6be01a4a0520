#pragma once

#include <filesystem>
#include <memory>
#include <sdlmodel/sdlmodel.hpp>

namespace sdlmodel {

    // Decodes an image file of any format SDL_image supports and converts it to `format`.
    // Throws std::runtime_error when the file cannot be decoded or converted.
    std::shared_ptr<Surface> loadImage(const std::filesystem::path& path, SDL_PixelFormat format = SDL_PIXELFORMAT_BGRA8888);

}
