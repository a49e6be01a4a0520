#include <sdlmodel/sdlmodel.hpp>

SDL_Color sdlmodel::Palette::color(int index) const {
    if (index < 0 || index >= count())
        return {};
    return palette_->colors[index];
}

std::vector<SDL_Color> sdlmodel::Palette::colors() const {
    std::vector<SDL_Color> ret{};
    for (int i = 0; i < count(); i++)
        ret.emplace_back(palette_->colors[i]);
    return ret;
}
